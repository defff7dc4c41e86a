#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "api/registry/v1.hpp"

using namespace registry::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  registryctl <addr> ping\n"
            << "  registryctl <addr> list\n"
            << "  registryctl <addr> submit <eth_address> <rgb_address> <signature> <message>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << static_cast<int>(status.error_code()) << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RegistrationService::NewStub(channel);

  grpc::ClientContext ctx;

  if (cmd == "ping") {
    PingRequest  req;
    PingResponse resp;
    auto         status = stub->Ping(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);
    std::cout << resp.message() << "\n";
    return 0;
  }

  if (cmd == "list") {
    ListRegistrationsRequest  req;
    ListRegistrationsResponse resp;
    auto                      status = stub->ListRegistrations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& r : resp.data()) {
      std::cout << r.id() << "\t" << r.eth_address() << "\t" << r.rgb_address() << "\t" << r.created_at() << "\n";
    }
    std::cout << resp.data_size() << " registration(s)\n";
    return 0;
  }

  if (cmd == "submit") {
    if (argc != 7) {
      Usage();
      return 1;
    }

    SubmitRequest req;
    req.set_eth_address(argv[3]);
    req.set_rgb_address(argv[4]);
    req.set_signature(argv[5]);
    req.set_message(argv[6]);

    SubmitResponse resp;
    auto           status = stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.message() << " " << resp.eth_address() << " -> " << resp.rgb_address() << " at " << resp.timestamp() << "\n";
    return 0;
  }

  Usage();
  return 1;
}

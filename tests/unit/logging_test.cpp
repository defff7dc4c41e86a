#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/core/registration_store.hpp"
#include "internal/core/signature_verifier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/registration_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using registry::observability::IntField;
using registry::observability::SerializeFields;
using registry::observability::StringField;

// Routes the default logger into `out`, one message per line, no prefix.
void CaptureLogs(std::ostringstream& out) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}

std::size_t CountLines(const std::string& text) {
  std::size_t lines = 0;
  for (char c : text) {
    if (c == '\n') ++lines;
  }
  return lines;
}

void TestPlainValuesStayBare() {
  assert(SerializeFields({StringField("backend", "sqlite"), IntField("id", 42)}) == "backend=sqlite id=42");
  assert(SerializeFields({StringField("signature", "0xabcdef12...")}) == "signature=0xabcdef12...");
}

void TestSeparatorsAreQuoted() {
  assert(SerializeFields({StringField("path", "/var/lib/my db")}) == R"(path="/var/lib/my db")");
  assert(SerializeFields({StringField("k", "a=b")}) == R"(k="a=b")");
}

void TestQuotesAndControlBytesAreEscaped() {
  assert(SerializeFields({StringField("v", "say \"hi\"")}) == R"(v="say \"hi\"")");
  assert(SerializeFields({StringField("v", "C:\\db")}) == R"(v="C:\\db")");
  assert(SerializeFields({StringField("v", "a\nb\rc\td")}) == R"(v="a\nb\rc\td")");
  assert(SerializeFields({StringField("v", std::string("x\x1b[31m", 6))}) == R"(v="x\x1b[31m")");
  assert(SerializeFields({StringField("v", "bell\x07")}) == R"(v="bell\x07")");
}

void TestOneCallIsOneLine() {
  std::ostringstream out;
  CaptureLogs(out);

  REGISTRY_LOG_INFO("Registration request received",
                    {StringField("eth_address", "x\nRegistration saved id=999"), StringField("rgb_address", "bc1\r\nforged")});

  const auto text = out.str();
  assert(CountLines(text) == 1);
  assert(text.rfind("Registration request received", 0) == 0);
  assert(text.find("\nRegistration saved") == std::string::npos);
}

void TestSubmittedAddressesCannotForgeLines() {
  std::ostringstream out;
  CaptureLogs(out);

  registry::service::ServiceContext ctx;
  ctx.store    = std::make_shared<registry::core::RegistrationStore>(std::make_shared<registry::db::memory::MemoryRepository>());
  ctx.verifier = std::make_shared<registry::core::LengthSignatureVerifier>();
  registry::service::RegistrationService service(ctx);

  registry::v1::SubmitRequest req;
  req.set_eth_address("x\nRegistration saved id=999");
  req.set_rgb_address("bc1pvalid");
  req.set_signature(std::string(120, 's'));
  req.set_message("m");

  bool rejected = false;
  try {
    (void)service.Submit(req);
  } catch (const registry::util::ValidationFailed&) {
    rejected = true;
  }
  assert(rejected);

  // every line starts with one of the service's own messages
  std::istringstream lines(out.str());
  std::string        line;
  std::size_t        count = 0;
  while (std::getline(lines, line)) {
    ++count;
    assert(line.rfind("Registration request received", 0) == 0 || line.rfind("Registration rejected", 0) == 0);
  }
  assert(count == 2);
}

} // namespace

int main() {
  TestPlainValuesStayBare();
  TestSeparatorsAreQuoted();
  TestQuotesAndControlBytesAreEscaped();
  TestOneCallIsOneLine();
  TestSubmittedAddressesCannotForgeLines();

  spdlog::shutdown();
  std::cout << "registry_unit_logging: pass\n";
  return 0;
}

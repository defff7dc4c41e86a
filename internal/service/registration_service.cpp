#include "registration_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>

#include "internal/core/registration_store.hpp"
#include "internal/core/signature_verifier.hpp"
#include "internal/core/validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace registry::service {

using namespace registry::v1;
using registry::observability::IntField;
using registry::observability::StringField;

namespace {

constexpr std::size_t kSignaturePreviewLength = 10;

std::string SignaturePreview(const std::string& signature) {
  if (signature.empty()) {
    return "none";
  }
  return signature.substr(0, kSignaturePreviewLength) + "...";
}

Registration ToRegistration(const registry::db::model::RegistrationRecord& record) {
  Registration out;
  out.set_id(record.id);
  out.set_eth_address(record.eth_address);
  out.set_rgb_address(record.rgb_address);
  out.set_signature(record.signature);
  out.set_message(record.message);
  out.set_created_at(record.created_at);
  out.set_updated_at(record.updated_at);
  return out;
}

// Rejections are expected traffic; only unexpected failures log at error.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_us = [&] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    REGISTRY_LOG_DEBUG("Call completed", {StringField("route", route), IntField("elapsed_us", elapsed_us())});
    return result;
  } catch (const registry::util::ValidationFailed& ex) {
    REGISTRY_LOG_INFO("Registration rejected", {StringField("route", route), StringField("reason", registry::core::ToString(ex.reason()))});
    throw;
  } catch (const registry::util::AlreadyExists&) {
    REGISTRY_LOG_INFO("Registration rejected", {StringField("route", route), StringField("reason", "duplicate")});
    throw;
  } catch (const std::exception& ex) {
    REGISTRY_LOG_ERROR("Call failed", {StringField("route", route), StringField("error", ex.what()), IntField("elapsed_us", elapsed_us())});
    throw;
  }
}

} // namespace

RegistrationService::RegistrationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.verifier) {
    throw std::invalid_argument("registration service requires a store and a signature verifier");
  }
}

SubmitResponse RegistrationService::Submit(const SubmitRequest& req) {
  return ObserveCall("RegistrationService.Submit", [&] {
    REGISTRY_LOG_INFO("Registration request received",
                      {StringField("eth_address", req.eth_address()), StringField("rgb_address", req.rgb_address()),
                       StringField("signature", SignaturePreview(req.signature())),
                       IntField("message_length", static_cast<std::int64_t>(req.message().size()))});

    registry::core::RegistrationCandidate candidate;
    candidate.eth_address = req.eth_address();
    candidate.rgb_address = req.rgb_address();
    candidate.signature   = req.signature();
    candidate.message     = req.message();

    const auto validation = registry::core::Validate(candidate, *ctx_.verifier);
    if (!validation) {
      throw registry::util::ValidationFailed(*validation.error);
    }

    const auto inserted = ctx_.store->Insert(candidate.eth_address, candidate.rgb_address, candidate.signature, candidate.message);
    switch (inserted.outcome) {
      case registry::core::InsertResult::Outcome::kCreated:
        break;
      case registry::core::InsertResult::Outcome::kConflict:
        throw registry::util::AlreadyExists("Registration already exists for this address combination");
      case registry::core::InsertResult::Outcome::kStoreFailure:
        throw registry::util::StoreUnavailable("save registration: " + inserted.cause);
    }

    REGISTRY_LOG_INFO("Registration saved", {IntField("id", inserted.id)});

    SubmitResponse resp;
    resp.set_success(true);
    resp.set_message("Registration successful");
    resp.set_eth_address(candidate.eth_address);
    resp.set_rgb_address(candidate.rgb_address);
    resp.set_timestamp(registry::util::FormatIso8601(registry::util::Now()));
    return resp;
  });
}

ListRegistrationsResponse RegistrationService::List(const ListRegistrationsRequest&) {
  return ObserveCall("RegistrationService.List", [&] {
    ListRegistrationsResponse resp;
    for (const auto& record : ctx_.store->ListAll()) {
      *resp.add_data() = ToRegistration(record);
    }
    resp.set_success(true);
    return resp;
  });
}

PingResponse RegistrationService::Ping(const PingRequest&) {
  PingResponse resp;
  resp.set_message(kPongMessage);
  return resp;
}

} // namespace registry::service

#include <spdlog/spdlog.h>
#include <ferry/codec/message.hpp>
#include <ferry/common/critical.hpp>
#include <ferry/routing/token_router.hpp>
#include <ferry/schema/key/router_keys.hpp>
#include <ferry/schema/transaction_error_code.hpp>
#include <ferry/schema/transfer_events.hpp>

#include <algorithm>
#include <iterator>
#include <string>

using namespace ferry::schema;

namespace {

constexpr auto kTransferRemoteCodespace =
    std::string_view{"ferry.transfer_remote"};
constexpr auto kHandleCodespace = std::string_view{"ferry.handle"};
constexpr auto kEnrollCodespace = std::string_view{"ferry.enroll"};

transaction_result_t make_failure(const transaction_error_code code,
                                  const std::string_view codespace,
                                  std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  spdlog::warn("{} rejected: {} ({})", codespace, result.log, result.info);
  return result;
}

std::string describe(const hash32_t& value) {
  return "0x" + to_hex(bytes_view_t{value.data(), value.size()});
}

}  // namespace

namespace ferry::routing {

token_router::token_router(
    ferry::mailbox::mailbox& mailbox,
    ferry::custody::custody& custody,
    ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
    const address_t& address,
    const address_t& owner)
    : mailbox_{mailbox},
      custody_{custody},
      storage_{storage},
      address_{address},
      owner_{owner} {
  spdlog::info("Token router {} ready on domain {} with {} enrolled peer(s)",
               describe(to_bytes32(address_)), mailbox_.local_domain(),
               domains().size());
}

domain_t token_router::local_domain() const {
  return mailbox_.local_domain();
}

transaction_result_t token_router::transfer_remote(
    const call_context& context,
    const domain_t destination,
    const hash32_t& recipient,
    const token_id_t& token_id,
    const std::string_view token_uri) {
  auto lock = std::scoped_lock{mutex_};
  auto state = ferry::custody::state_t{storage_};

  if (auto error = custody_.debit(state, context.sender, token_id)) {
    return make_failure(*error, kTransferRemoteCodespace,
                        "custody debit failed for token " + token_id.str());
  }

  auto payload = ferry::codec::format(recipient, token_id, token_uri);

  auto peer = find_remote_router(destination);
  if (!peer) {
    return make_failure(transaction_error_code::destination_unenrolled,
                        kTransferRemoteCodespace,
                        "no router enrolled for domain " +
                            std::to_string(destination));
  }
  auto dispatch_error = std::string{};
  auto message_id = mailbox_.dispatch(
      to_bytes32(address_), destination, *peer,
      bytes_view_t{payload.data(), payload.size()}, context.value,
      dispatch_error);
  if (!message_id) {
    return make_failure(transaction_error_code::dispatch_failed,
                        kTransferRemoteCodespace, dispatch_error);
  }

  state.commit();

  auto result = transaction_result_t{};
  result.data = bytes_t{std::begin(*message_id), std::end(*message_id)};
  result.events.push_back(
      make_sent_transfer_remote_event(destination, recipient, token_id));
  spdlog::info("Sent token {} to {} on domain {} as message {}",
               token_id.str(), describe(recipient), destination,
               describe(*message_id));
  return result;
}

std::optional<amount_t> token_router::quote_transfer_remote(
    const domain_t destination,
    const hash32_t& recipient,
    const token_id_t& token_id,
    const std::string_view token_uri) const {
  auto lock = std::scoped_lock{mutex_};
  auto peer = find_remote_router(destination);
  if (!peer) {
    return std::nullopt;
  }
  auto payload = ferry::codec::format(recipient, token_id, token_uri);
  return mailbox_.quote_dispatch(destination, *peer,
                                 bytes_view_t{payload.data(), payload.size()});
}

transaction_result_t token_router::handle(const address_t& caller,
                                          const domain_t origin,
                                          const hash32_t& sender,
                                          const bytes_view_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != mailbox_.address()) {
    return make_failure(transaction_error_code::unauthorized_caller,
                        kHandleCodespace,
                        "caller " + describe(to_bytes32(caller)) +
                            " is not the mailbox");
  }
  auto peer = find_remote_router(origin);
  if (!peer || *peer != sender) {
    return make_failure(transaction_error_code::unenrolled_router,
                        kHandleCodespace,
                        "sender " + describe(sender) +
                            " is not enrolled for domain " +
                            std::to_string(origin));
  }

  auto message = ferry::codec::try_decode(payload);
  if (!message) {
    return make_failure(transaction_error_code::malformed_payload,
                        kHandleCodespace,
                        "payload of " + std::to_string(payload.size()) +
                            " bytes is shorter than " +
                            std::to_string(ferry::codec::kPrefixSize));
  }

  auto state = ferry::custody::state_t{storage_};
  if (auto error =
          custody_.credit(state, to_address(message->recipient),
                          message->token_id, message->token_uri)) {
    return make_failure(*error, kHandleCodespace,
                        "custody credit failed for token " +
                            message->token_id.str());
  }
  state.commit();

  auto result = transaction_result_t{};
  result.events.push_back(make_received_transfer_remote_event(
      origin, message->recipient, message->token_id));
  spdlog::info("Received token {} for {} from domain {}",
               message->token_id.str(), describe(message->recipient), origin);
  return result;
}

transaction_result_t token_router::enroll_remote_router(
    const address_t& caller,
    const domain_t domain,
    const hash32_t& router) {
  return enroll_remote_routers(caller, {remote_router_t{domain, router}});
}

transaction_result_t token_router::enroll_remote_routers(
    const address_t& caller,
    const std::vector<remote_router_t>& routers) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != owner_) {
    return make_failure(transaction_error_code::not_router_owner,
                        kEnrollCodespace, "only the owner may enroll routers");
  }
  const auto local = mailbox_.local_domain();
  if (std::any_of(std::begin(routers), std::end(routers),
                  [local](const remote_router_t& entry) {
                    return entry.first == local;
                  })) {
    return make_failure(transaction_error_code::local_domain_enrollment,
                        kEnrollCodespace,
                        "domain " + std::to_string(local) +
                            " is served by this router");
  }
  auto state = ferry::custody::state_t{storage_};
  for (const auto& [domain, router] : routers) {
    auto router_key = key::make_remote_router_key(domain);
    state.put(bytes_view_t{router_key.data(), router_key.size()},
              bytes_t{std::begin(router), std::end(router)});
  }
  state.commit();
  for (const auto& [domain, router] : routers) {
    spdlog::info("Enrolled router {} for domain {}", describe(router), domain);
  }
  return {};
}

transaction_result_t token_router::unenroll_remote_router(
    const address_t& caller,
    const domain_t domain) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != owner_) {
    return make_failure(transaction_error_code::not_router_owner,
                        kEnrollCodespace,
                        "only the owner may unenroll routers");
  }
  auto state = ferry::custody::state_t{storage_};
  auto router_key = key::make_remote_router_key(domain);
  state.erase(bytes_view_t{router_key.data(), router_key.size()});
  state.commit();
  spdlog::info("Unenrolled router for domain {}", domain);
  return {};
}

std::optional<hash32_t> token_router::remote_router(
    const domain_t domain) const {
  auto lock = std::scoped_lock{mutex_};
  return find_remote_router(domain);
}

std::vector<domain_t> token_router::domains() const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = make_bytes(key::kRemoteRouterKeyPrefix);
  auto rows =
      storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  auto out = std::vector<domain_t>{};
  out.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    if (auto domain = key::parse_remote_router_key(
            bytes_view_t{row_key.data(), row_key.size()})) {
      out.push_back(*domain);
    }
  }
  return out;
}

std::optional<hash32_t> token_router::find_remote_router(
    const domain_t domain) const {
  auto router_key = key::make_remote_router_key(domain);
  auto raw =
      storage_.get_raw(bytes_view_t{router_key.data(), router_key.size()});
  if (!raw) {
    return std::nullopt;
  }
  if (raw->size() != 32) {
    ferry::common::critical(
        "corrupt router enrollment for domain {}: {} bytes", domain,
        raw->size());
  }
  return make_hash32(*raw);
}

}  // namespace ferry::routing

#include "hedge/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace hedge {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

nlohmann::json requestJson(const domain::OrderRequest& r) {
  nlohmann::json j;
  j["key"] = r.idempotency_key;
  j["symbol"] = r.symbol;
  j["side"] = domain::toString(r.side);
  j["purpose"] = domain::toString(r.purpose);
  j["leg_index"] = r.leg_index;
  j["notional_usd"] = r.notional_usd;
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  if (!telemetry_queue_.push(std::move(event))) {
    // Log the first drop and then every 1000th, not every one.
    const std::size_t dropped = telemetry_queue_.dropped();
    if (dropped == 1 || dropped % 1000 == 0) {
      std::cerr << "[IpcServer] telemetry backlog full, dropped " << dropped
                << " event(s) so far\n";
    }
  }
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    auto json_str = formatTelemetry(event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round-trip, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must always answer or the socket is stuck in the wrong state.
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["response"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per event kind
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      Overloaded{
          [](const PriceObservedEvent&) -> std::optional<std::string> {
            return std::nullopt;
          },
          [](const OrderSubmittedEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "order_submitted";
            j["side"] = domain::toString(e.side);
            j["order"] = requestJson(e.request);
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const OrderFilledEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "order_filled";
            j["side"] = domain::toString(e.side);
            j["order"] = requestJson(e.request);
            j["filled_notional_usd"] = e.result.filled_notional_usd;
            j["avg_price"] = e.result.avg_price;
            j["status"] = domain::toString(e.result.status);
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const StateTransitionEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "state_transition";
            j["side"] = domain::toString(e.side);
            j["symbol"] = e.symbol;
            j["from"] = domain::toString(e.from);
            j["to"] = domain::toString(e.to);
            j["reason"] = e.reason;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const CapReachedEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "cap_reached";
            j["side"] = domain::toString(e.side);
            j["symbol"] = e.symbol;
            j["total_notional_usd"] = e.total_notional_usd;
            j["legs_filled"] = e.legs_filled;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const SideHaltedEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "side_halted";
            j["side"] = domain::toString(e.side);
            j["symbol"] = e.symbol;
            j["reason"] = e.reason;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const PositionUpdateEvent& e) -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "position_update";
            j["side"] = domain::toString(e.position.side);
            j["symbol"] = e.position.symbol;
            j["state"] = domain::toString(e.position.state);
            j["total_notional_usd"] = e.position.total_notional_usd;
            j["legs_filled"] = e.position.legs_filled;
            j["avg_entry_price"] = e.position.avg_entry_price;
            j["halted"] = e.position.halted;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const ReconciliationMismatchEvent& e)
              -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "reconciliation_mismatch";
            j["side"] = domain::toString(e.side);
            j["symbol"] = e.symbol;
            j["memory_notional_usd"] = e.memory_notional_usd;
            j["exchange_notional_usd"] = e.exchange_notional_usd;
            j["detail"] = e.detail;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
          [](const CollaboratorFailureEvent& e)
              -> std::optional<std::string> {
            nlohmann::json j;
            j["type"] = "collaborator_failure";
            j["operation"] = e.operation;
            j["target"] = e.target;
            j["code"] = domain::toString(e.error.code);
            j["message"] = e.error.message;
            j["attempt"] = e.attempt;
            j["will_retry"] = e.will_retry;
            j["timestamp_ms"] = e.timestamp_ms;
            return j.dump();
          },
      },
      event);
}

}  // namespace hedge

#include "qfolio/network/audit_publisher.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace qfolio {

AuditPublisher::AuditPublisher(CommandHandler command_handler,
                               std::string pub_endpoint,
                               std::string cmd_endpoint)
    : command_handler_(std::move(command_handler)),
      pub_endpoint_(std::move(pub_endpoint)),
      cmd_endpoint_(std::move(cmd_endpoint)) {}

AuditPublisher::~AuditPublisher() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void AuditPublisher::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  auto cmd = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);

  cmd->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);
  pub->bind(pub_endpoint_);
  cmd->bind(cmd_endpoint_);

  context_ = std::move(context);
  pub_socket_ = std::move(pub);
  cmd_socket_ = std::move(cmd);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[AuditPublisher] started. PUB=" << pub_endpoint_
            << " CMD=" << cmd_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, release sockets
// -----------------------------------------------------------------------------
void AuditPublisher::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[AuditPublisher] stopped after " << published_.load()
            << " records (" << outbound_.dropped() << " dropped).\n";
}

Status AuditPublisher::append(const nlohmann::json& record) {
  if (!running_.load()) {
    return makeError(ErrorKind::TransientFailure,
                     "audit publisher is not running", "audit");
  }
  if (!outbound_.push(record.dump())) {
    std::cerr << "[AuditPublisher] queue full, dropped oldest record ("
              << outbound_.dropped() << " total)\n";
  }
  return okStatus();
}

void AuditPublisher::run() {
  while (running_.load()) {
    processRecords();
    processCommands();
  }

  // Publish whatever was queued before stop().
  processRecords();
}

// -----------------------------------------------------------------------------
// processRecords(): drain queue onto the PUB socket
// -----------------------------------------------------------------------------
void AuditPublisher::processRecords() {
  while (auto record = outbound_.try_pop()) {
    zmq::message_t msg(record->data(), record->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      published_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one bounded recv on the REP socket, then reply
// -----------------------------------------------------------------------------
void AuditPublisher::processCommands() {
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

  const std::string command = request.to_string();
  std::cout << "[AuditPublisher] command: " << command << "\n";
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace qfolio

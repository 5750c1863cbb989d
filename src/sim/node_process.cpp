// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/node_process.hpp"
#include "sim/event_log.hpp"
#include "sim/node_protocol.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <istream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace lorasim {
namespace sim {

namespace {

// A write to a node that already exited must fail with EPIPE instead of
// killing the orchestrator.
void IgnoreSigpipe() {
  static std::once_flag flag;
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// stdin, stdout, stderr and the exec-status pipe
struct SpawnPipes {
  int in[2] = {-1, -1};
  int out[2] = {-1, -1};
  int err[2] = {-1, -1};
  int status[2] = {-1, -1};

  bool open() {
    return pipe2(in, O_CLOEXEC) == 0 && pipe2(out, O_CLOEXEC) == 0 &&
           pipe2(err, O_CLOEXEC) == 0 && pipe2(status, O_CLOEXEC) == 0;
  }

  ~SpawnPipes() {
    for (int *p : {in, out, err, status}) {
      CloseFd(p[0]);
      CloseFd(p[1]);
    }
  }
};

} // namespace

NodeProcess::NodeProcess(PrivateTag, std::string name, const util::SimClock &clock,
                         EventLog &events, TransmitCallback on_transmit)
    : name_(std::move(name)), clock_(clock), events_(events),
      on_transmit_(std::move(on_transmit)), stdin_(io_context_),
      stdout_(io_context_), stderr_(io_context_) {}

std::shared_ptr<NodeProcess>
NodeProcess::Spawn(const std::string &name, const std::string &executable,
                   const std::filesystem::path &log_dir,
                   const util::SimClock &clock, EventLog &events,
                   TransmitCallback on_transmit) {
  IgnoreSigpipe();

  auto node = std::make_shared<NodeProcess>(PrivateTag{}, name, clock, events,
                                            std::move(on_transmit));

  try {
    const util::OutputLayout layout{log_dir};
    node->stdout_log_ = CreateLineFileLogger(name + ".stdout", layout.node_stdout_log(name));
    node->stderr_log_ = CreateLineFileLogger(name + ".stderr", layout.node_stderr_log(name));
  } catch (const spdlog::spdlog_ex &e) {
    throw SpawnError("cannot create output logs for node " + name + ": " + e.what());
  }

  SpawnPipes pipes;
  if (!pipes.open()) {
    throw SpawnError("cannot create pipes for node " + name + ": " +
                     std::strerror(errno));
  }

  // Everything the child touches is prepared before fork(); between fork and
  // exec only async-signal-safe calls are allowed.
  std::vector<char *> argv{const_cast<char *>(executable.c_str()), nullptr};

  pid_t pid = fork();
  if (pid < 0) {
    throw SpawnError("fork failed for node " + name + ": " + std::strerror(errno));
  }

  if (pid == 0) {
    // Ignored dispositions survive exec; node programs get the default
    std::signal(SIGPIPE, SIG_DFL);
    setpgid(0, 0);
    dup2(pipes.in[0], STDIN_FILENO);
    dup2(pipes.out[1], STDOUT_FILENO);
    dup2(pipes.err[1], STDERR_FILENO);
    execv(argv[0], argv.data());
    int exec_errno = errno;
    ssize_t n = write(pipes.status[1], &exec_errno, sizeof(exec_errno));
    (void)n;
    _exit(127);
  }

  // Races with the child's own setpgid; whichever runs first wins and the
  // other fails harmlessly.
  setpgid(pid, pid);

  CloseFd(pipes.in[0]);
  CloseFd(pipes.out[1]);
  CloseFd(pipes.err[1]);
  CloseFd(pipes.status[1]);

  // The status pipe is close-on-exec: EOF means exec succeeded, data means
  // it failed and carries the child's errno.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(pipes.status[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    throw SpawnError("cannot execute '" + executable + "' for node " + name +
                     ": " + std::strerror(exec_errno));
  }

  node->pid_ = pid;
  node->stdin_.assign(pipes.in[1]);
  pipes.in[1] = -1;
  node->stdout_.assign(pipes.out[0]);
  pipes.out[0] = -1;
  node->stderr_.assign(pipes.err[0]);
  pipes.err[0] = -1;

  node->start_readers();

  LOG_NODE_INFO("Spawned node {} (pid {}, program {})", name, pid, executable);
  return node;
}

NodeProcess::~NodeProcess() {
  terminate();
  join_readers();
}

void NodeProcess::join_readers() {
  // Never join from a reader itself (last reference released by a callback)
  for (std::thread *t : {&stdout_thread_, &stderr_thread_}) {
    if (!t->joinable()) {
      continue;
    }
    if (t->get_id() == std::this_thread::get_id()) {
      t->detach();
    } else {
      t->join();
    }
  }
}

void NodeProcess::start_readers() {
  stdout_open_ = true;
  stdout_thread_ = std::thread(&NodeProcess::read_stdout_loop, this);
  stderr_thread_ = std::thread(&NodeProcess::read_stderr_loop, this);
}

bool NodeProcess::send(const std::string &command_line) {
  std::string line = command_line;
  line += protocol::LINE_DELIMITER;

  std::lock_guard<std::mutex> lock(stdin_mutex_);
  if (!stdin_.is_open()) {
    LOG_NODE_DEBUG("{}: dropping command, stdin closed: {}", name_, command_line);
    return false;
  }

  boost::system::error_code ec;
  boost::asio::write(stdin_, boost::asio::buffer(line), ec);
  if (ec) {
    LOG_NODE_WARN("{}: failed to write command '{}': {}", name_, command_line,
                  ec.message());
    return false;
  }
  return true;
}

std::optional<std::string>
NodeProcess::query_state(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> query_lock(query_mutex_);

  // Latest, not history: a stale response must not answer this query
  if (responses_.Clear()) {
    LOG_NODE_TRACE("{}: discarded unconsumed response before get_state", name_);
  }

  if (!send(protocol::commands::GET_STATE)) {
    return std::nullopt;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto line = responses_.TakeUntil(deadline);
    if (!line) {
      LOG_NODE_DEBUG("{}: no state response within {} ms", name_, timeout.count());
      return std::nullopt;
    }
    if (IsStateResponse(*line)) {
      return line;
    }
    LOG_NODE_TRACE("{}: skipping non-state response while querying: {}", name_, *line);
  }
}

void NodeProcess::terminate() {
  if (terminated_.exchange(true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    boost::system::error_code ignored;
    stdin_.close(ignored);
  }

  if (pid_ <= 0) {
    return;
  }

  // Errors are expected here: the process may already be gone
  if (::kill(-pid_, SIGTERM) != 0) {
    ::kill(pid_, SIGTERM);
  }

  using clock = std::chrono::steady_clock;
  auto deadline = clock::now() + kTerminateGrace;
  int status = 0;
  while (true) {
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
      LOG_NODE_DEBUG("Node {} (pid {}) terminated", name_, pid_);
      return;
    }
    if (clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOG_NODE_DEBUG("Node {} (pid {}) ignored SIGTERM, killing", name_, pid_);
  if (::kill(-pid_, SIGKILL) != 0) {
    ::kill(pid_, SIGKILL);
  }
  waitpid(pid_, &status, 0);
}

void NodeProcess::read_stdout_loop() {
  boost::asio::streambuf buffer;
  std::istream stream(&buffer);
  boost::system::error_code ec;

  while (true) {
    boost::asio::read_until(stdout_, buffer, protocol::LINE_DELIMITER, ec);
    if (ec && buffer.size() == 0) {
      break;
    }
    // On EOF the buffer holds an unterminated last line; it is still a line
    std::string line;
    std::getline(stream, line);
    handle_stdout_line(StripLineEnding(line));
  }

  stdout_open_ = false;
  LOG_NODE_DEBUG("{}: stdout closed ({})", name_, ec.message());
}

void NodeProcess::read_stderr_loop() {
  boost::asio::streambuf buffer;
  std::istream stream(&buffer);
  boost::system::error_code ec;

  while (true) {
    boost::asio::read_until(stderr_, buffer, protocol::LINE_DELIMITER, ec);
    if (ec && buffer.size() == 0) {
      break;
    }
    std::string line;
    std::getline(stream, line);
    stderr_log_->info("{},{}", util::FormatSeconds(clock_.ElapsedSeconds()),
                      StripLineEnding(line));
  }
}

void NodeProcess::handle_stdout_line(const std::string &line) {
  stdout_log_->info("{},{}", util::FormatSeconds(clock_.ElapsedSeconds()), line);

  NodeLine parsed = ClassifyNodeLine(line);

  if (auto *packet = std::get_if<TransmitPacket>(&parsed)) {
    if (packet->declared_length &&
        static_cast<size_t>(*packet->declared_length) * 2 != packet->hexdata.size()) {
      LOG_NODE_DEBUG("{}: transmit_packet length {} does not match {} hex chars",
                     name_, *packet->declared_length, packet->hexdata.size());
    }
    events_.Tx(clock_.ElapsedSeconds(), name_, packet->hexdata);
    if (on_transmit_) {
      try {
        on_transmit_(name_, packet->hexdata);
      } catch (const std::exception &e) {
        LOG_NODE_ERROR("{}: packet fan-out failed: {}", name_, e.what());
      }
    }
  } else if (auto *response = std::get_if<ResponseLine>(&parsed)) {
    if (responses_.Put(std::move(response->text))) {
      LOG_NODE_TRACE("{}: unconsumed response replaced", name_);
    }
  } else if (auto *malformed = std::get_if<MalformedTransmit>(&parsed)) {
    LOG_NODE_WARN("{}: dropping transmit_packet ({}): {}", name_, malformed->reason,
                  malformed->text);
  }
}

} // namespace sim
} // namespace lorasim

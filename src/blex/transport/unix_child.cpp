/* BLE-Xact: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "blex/transport/unix_child.hpp"
#include "blex/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <boost/chrono/round.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace blex::transport
{

// Implementations.

Unix_child::Unix_child(flow::log::Logger* logger_ptr, const Config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_config(config),
  m_stopped(false),
  m_running(false),
  /* (Linux) OS thread name will truncate the socket file name to 15-5=10 chars; that'll usually be enough to
   * tell attempts of different transports apart. */
  m_worker(get_logger(), flow::util::ostream_op_string("BLEX-", m_config.m_sock_path.filename().string())),
  m_peer(*(m_worker.task_engine())),
  m_accept_timer(*(m_worker.task_engine())),
  m_sigchld(*(m_worker.task_engine()), SIGCHLD),
  m_child_pid(0),
  m_accept_done(false),
  m_failed(false),
  m_start_result_set(false),
  m_from_child(m_config.m_rcv_depth),
  m_err_child(util::Sync_queue<Error_code>::S_UNBOUNDED)
{
  assert((m_config.m_max_msg_size != 0) && (m_config.m_rcv_depth != 0) && "Broke contract.");
  FLOW_LOG_TRACE("Unix_child [" << *this << "]: Created; child [" << m_config.m_child_path << "].");
}

Unix_child::~Unix_child()
{
  stop();
}

void Unix_child::start(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Unix_child::start()"))
  {
    return;
  }
  // else

  auto start_result = m_start_result.get_future();
  {
    Lock lock(m_lifecycle_mutex);
    if (m_stopped)
    {
      FLOW_LOG_WARNING("Unix_child [" << *this << "]: start() after stop(); ignoring.");
      *err_code = error::Code::S_XPORT_STOPPED;
      return;
    }
    // else

    Error_code sys_err_code;
    fs::remove(m_config.m_sock_path, sys_err_code); // Fine if it wasn't there.
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Unix_child [" << *this << "]: Could not remove stale socket file; details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = error::Code::S_CHILD_START_FAILED;
      return;
    }
    // else

    FLOW_LOG_INFO("Unix_child [" << *this << "]: Starting: will listen, spawn child [" << m_config.m_child_path << "] "
                  "and give it [" << boost::chrono::round<boost::chrono::milliseconds>(m_config.m_accept_timeout)
                  << "] to connect.");
    m_worker.start([this]()
    {
      flow::async::reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.
      start_in_worker();
    });
  } // Lock lock(m_lifecycle_mutex);

  // Unlocked: stop() may now come in and abort the wait.
  const auto result = start_result.get();
  if (result)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Start failed [" << result << "] [" << result.message() << "]; "
                     "cleaning up.");
    stop();
    *err_code = result;
    return;
  }
  // else

  {
    Lock lock(m_lifecycle_mutex);
    if (m_stopped)
    {
      *err_code = error::Code::S_XPORT_STOPPED;
      return;
    }
    // else
    m_running = true;
  }

  FLOW_LOG_INFO("Unix_child [" << *this << "]: Child PID [" << m_child_pid.load() << "] connected.  Running.");
  err_code->clear();
} // Unix_child::start()

void Unix_child::start_in_worker()
{
  using asio_local_stream_socket::Acceptor;
  using asio_local_stream_socket::Endpoint;
  using boost::system::system_error;

  // We are in thread W.

  try
  {
    // Throws on error.  (There's no error-code-returning ctor; it's normal in boost.asio ctors.)
    m_acceptor.reset(new Acceptor(*(m_worker.task_engine()), Endpoint(m_config.m_sock_path.string())));
  }
  catch (const system_error& exc)
  {
    assert(!m_acceptor);
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Unable to open/bind/listen native local stream socket; "
                     "details follow.");
    const Error_code sys_err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    set_start_result(error::Code::S_CHILD_START_FAILED);
    return;
  }

  // Arm this before forking, so a child that dies instantly is not missed.
  await_child_exit();

  Error_code sys_err_code;
  spawn_child(&sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Could not execute child [" << m_config.m_child_path << "]; "
                     "details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    set_start_result(error::Code::S_CHILD_START_FAILED);
    return;
  }
  // else

  m_acceptor->async_accept(m_peer, [this](const Error_code& async_err_code)
  {
    // We are in thread W.
    on_accept(async_err_code);
  });

  m_accept_timer.expires_after(m_config.m_accept_timeout);
  m_accept_timer.async_wait([this](const Error_code& async_err_code)
  {
    // We are in thread W.
    on_accept_timeout(async_err_code);
  });
} // Unix_child::start_in_worker()

void Unix_child::spawn_child(Error_code* err_code)
{
  using boost::system::system_category;

  // We are in thread W.

  /* Prepare everything the child needs before fork(): in a multi-threaded parent, the child may only do
   * async-signal-safe things between fork() and execv(). */
  const std::string exe = m_config.m_child_path.string();
  std::vector<std::string> args;
  args.reserve(m_config.m_child_args.size() + 1);
  args.push_back(exe);
  args.insert(args.end(), m_config.m_child_args.begin(), m_config.m_child_args.end());
  std::vector<char*> argv;
  for (auto& arg : args)
  {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  // The child reports execv() failure (its errno) through this; successful execv() just closes it (CLOEXEC).
  int exec_err_pipe[2];
  if (::pipe2(exec_err_pipe, O_CLOEXEC) == -1)
  {
    *err_code = Error_code(errno, system_category());
    return;
  }
  // else

  const auto pid = ::fork();
  if (pid == -1)
  {
    *err_code = Error_code(errno, system_category());
    ::close(exec_err_pipe[0]);
    ::close(exec_err_pipe[1]);
    return;
  }
  // else

  if (pid == 0)
  {
    // We are the child.
    ::close(exec_err_pipe[0]);
    ::execv(argv[0], argv.data());
    const int exec_errno = errno;
    [[maybe_unused]] const auto n_written = ::write(exec_err_pipe[1], &exec_errno, sizeof(exec_errno));
    ::_exit(127);
  }
  // else: We are the parent.

  ::close(exec_err_pipe[1]);
  int exec_errno = 0;
  ssize_t n_read;
  do
  {
    n_read = ::read(exec_err_pipe[0], &exec_errno, sizeof(exec_errno));
  }
  while ((n_read == -1) && (errno == EINTR));
  ::close(exec_err_pipe[0]);

  if (n_read == ssize_t(sizeof(exec_errno)))
  {
    int status;
    ::waitpid(pid, &status, 0); // It _exit()s right after writing.
    *err_code = Error_code(exec_errno, system_category());
    return;
  }
  // else

  m_child_pid = pid;
  FLOW_LOG_INFO("Unix_child [" << *this << "]: Spawned child [" << m_config.m_child_path << "] "
                "as PID [" << pid << "].");
  err_code->clear();
} // Unix_child::spawn_child()

void Unix_child::on_accept(const Error_code& sys_err_code)
{
  // We are in thread W.
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_accept_done)
  {
    return; // Timed out, child died, or stop()ping.
  }
  // else
  m_accept_done = true;

  m_accept_timer.cancel();
  // Exactly one peer is expected; stop listening.
  Error_code dummy;
  m_acceptor->close(dummy);

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: The accept failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    set_start_result(error::Code::S_CHILD_START_FAILED);
    return;
  }
  // else

  FLOW_LOG_TRACE("Unix_child [" << *this << "]: Child connected.  Starting read chain.");
  set_start_result(Error_code());
  read_hdr();
}

void Unix_child::on_accept_timeout(const Error_code& sys_err_code)
{
  // We are in thread W.
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_accept_done)
  {
    return;
  }
  // else
  m_accept_done = true;

  FLOW_LOG_WARNING("Unix_child [" << *this << "]: Child did not connect within "
                   "[" << boost::chrono::round<boost::chrono::milliseconds>(m_config.m_accept_timeout) << "].");
  Error_code dummy;
  m_acceptor->close(dummy); // Its handler gets operation_aborted.
  set_start_result(error::Code::S_CHILD_ACCEPT_TIMEOUT);
}

void Unix_child::await_child_exit()
{
  m_sigchld.async_wait([this](const Error_code& async_err_code, int)
  {
    // We are in thread W.
    on_sigchld(async_err_code);
  });
}

void Unix_child::on_sigchld(const Error_code& async_err_code)
{
  // We are in thread W.
  if (async_err_code == boost::asio::error::operation_aborted)
  {
    return;
  }
  // else

  const util::process_id_t pid = m_child_pid;
  if (pid == 0)
  {
    return; // Not ours (we have none).  Keep quiet.
  }
  // else

  int status;
  pid_t reaped_pid;
  do
  {
    reaped_pid = ::waitpid(pid, &status, WNOHANG);
  }
  while ((reaped_pid == -1) && (errno == EINTR));

  if (reaped_pid == 0)
  {
    // Ours is still running: the signal was about some other child of this process.
    await_child_exit();
    return;
  }
  // else

  m_child_pid = 0;
  if (reaped_pid == -1)
  {
    /* Someone else in this process reaped it (or it is otherwise not waitable anymore).  Either way it is gone,
     * and we can no longer learn how it ended; treat it like any other exit. */
    const Error_code sys_err_code(errno, boost::system::system_category());
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Child PID [" << pid << "] could not be reaped; treating it as "
                     "exited; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }
  else if (WIFEXITED(status))
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Child PID [" << pid << "] exited with "
                     "code [" << WEXITSTATUS(status) << "].");
  }
  else
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Child PID [" << pid << "] terminated by "
                     "signal [" << (WIFSIGNALED(status) ? WTERMSIG(status) : -1) << "].");
  }

  if (!m_accept_done)
  {
    m_accept_done = true;
    m_accept_timer.cancel();
    Error_code dummy;
    m_acceptor->close(dummy);
    set_start_result(error::Code::S_CHILD_FAILED);
    return;
  }
  // else
  fail(error::Code::S_CHILD_FAILED, "child process exit");
} // Unix_child::on_sigchld()

void Unix_child::read_hdr()
{
  // We are in thread W.
  boost::asio::async_read(m_peer, boost::asio::buffer(m_rcv_hdr),
                          [this](const Error_code& async_err_code, size_t)
  {
    on_hdr(async_err_code);
  });
}

void Unix_child::on_hdr(const Error_code& sys_err_code)
{
  // We are in thread W.
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_failed)
  {
    return;
  }
  // else

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Reading message header failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    fail(error::Code::S_CHILD_FAILED, "header read");
    return;
  }
  // else

  // Little-endian regardless of our byte order.
  const size_t size = size_t(m_rcv_hdr[0])
                      | (size_t(m_rcv_hdr[1]) << 8)
                      | (size_t(m_rcv_hdr[2]) << 16)
                      | (size_t(m_rcv_hdr[3]) << 24);
  if ((size == 0) || (size > m_config.m_max_msg_size))
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Inbound message header announces size [" << size << "]; "
                     "allowed range is [1, " << m_config.m_max_msg_size << "].");
    fail(error::Code::S_MESSAGE_SIZE_EXCEEDED, "header validation");
    return;
  }
  // else

  m_rcv_body = util::Blob(get_logger(), size);
  boost::asio::async_read(m_peer, boost::asio::buffer(m_rcv_body.begin(), m_rcv_body.size()),
                          [this](const Error_code& async_err_code, size_t)
  {
    on_body(async_err_code);
  });
} // Unix_child::on_hdr()

void Unix_child::on_body(const Error_code& sys_err_code)
{
  // We are in thread W.
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_failed)
  {
    return;
  }
  // else

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Reading message body failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    fail(error::Code::S_CHILD_FAILED, "body read");
    return;
  }
  // else

  FLOW_LOG_TRACE("Unix_child [" << *this << "]: Received message of size [" << m_rcv_body.size() << "].");
  FLOW_LOG_DATA("Unix_child [" << *this << "]: Message contents:\n" << util::hex_dump(util::blob_view(m_rcv_body)));

  // May block, if the consumer is behind.  Returns false if stop() closed the queue.
  if (!m_from_child.push(std::move(m_rcv_body)))
  {
    return;
  }
  // else
  read_hdr();
}

void Unix_child::to_child(util::Blob&& blob, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { to_child(std::move(blob), actual_err_code); },
         err_code, "Unix_child::to_child()"))
  {
    return;
  }
  // else

  if (!m_running)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Cannot send message of size [" << blob.size() << "]: "
                     "not running.");
    *err_code = error::Code::S_XPORT_NOT_STARTED;
    return;
  }
  // else
  const size_t size = blob.size();
  if ((size == 0) || (size > m_config.m_max_msg_size))
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Cannot send message of size [" << size << "]: "
                     "allowed range is [1, " << m_config.m_max_msg_size << "].");
    *err_code = error::Code::S_MESSAGE_SIZE_EXCEEDED;
    return;
  }
  // else

  auto frame = std::make_shared<util::Blob>(get_logger(), S_HDR_SIZE + size);
  auto frame_ptr = frame->begin();
  frame_ptr[0] = uint8_t(size & 0xFF);
  frame_ptr[1] = uint8_t((size >> 8) & 0xFF);
  frame_ptr[2] = uint8_t((size >> 16) & 0xFF);
  frame_ptr[3] = uint8_t((size >> 24) & 0xFF);
  std::memcpy(frame_ptr + S_HDR_SIZE, blob.const_begin(), size);
  blob.clear();

  m_worker.post([this, frame = std::move(frame)]()
  {
    // We are in thread W.
    if (m_failed)
    {
      FLOW_LOG_TRACE("Unix_child [" << *this << "]: Dropping outbound frame of size [" << frame->size() << "]: "
                     "connection has failed.");
      return;
    }
    // else

    m_snd_q.push(frame);
    if (m_snd_q.size() == 1)
    {
      write_next();
    }
    // else: on_write() will get to it.
  });

  err_code->clear();
} // Unix_child::to_child()

void Unix_child::write_next()
{
  // We are in thread W.
  assert(!m_snd_q.empty());
  const auto& frame = m_snd_q.front();
  boost::asio::async_write(m_peer, boost::asio::buffer(frame->const_begin(), frame->size()),
                           [this](const Error_code& async_err_code, size_t)
  {
    on_write(async_err_code);
  });
}

void Unix_child::on_write(const Error_code& sys_err_code)
{
  // We are in thread W.
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_failed)
  {
    return;
  }
  // else

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Writing message failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    fail(error::Code::S_CHILD_FAILED, "write");
    return;
  }
  // else

  m_snd_q.pop();
  if (!m_snd_q.empty())
  {
    write_next();
  }
}

void Unix_child::fail(const Error_code& cause, util::String_view context)
{
  // We are in thread W.
  if (m_failed)
  {
    return;
  }
  // else
  m_failed = true;
  m_running = false;

  FLOW_LOG_WARNING("Unix_child [" << *this << "]: Fatal condition during [" << context << "]; reporting "
                   "[" << cause << "] [" << cause.message() << "] and closing connection.");
  Error_code dummy;
  m_peer.close(dummy);
  std::queue<Frame_ptr>().swap(m_snd_q);

  Error_code err_to_report = cause;
  m_err_child.push(std::move(err_to_report)); // Unbounded: never blocks.  False (ignored) if already stopped.
}

bool Unix_child::from_child(util::Blob* target)
{
  return m_from_child.pop(target);
}

bool Unix_child::err_child(Error_code* target)
{
  return m_err_child.pop(target);
}

void Unix_child::stop()
{
  Lock lock(m_lifecycle_mutex);
  if (m_stopped)
  {
    return;
  }
  // else
  m_stopped = true;
  m_running = false;

  FLOW_LOG_INFO("Unix_child [" << *this << "]: Stopping.");

  // Unblock everyone: consumers of both queues; W if it is pushing onto a full m_from_child; a waiting start().
  m_from_child.close();
  m_err_child.close();
  set_start_result(error::Code::S_XPORT_STOPPED);

  m_worker.stop();
  // Thread W is (synchronously!) no more.  We can touch its stuff.

  const util::process_id_t pid = m_child_pid;
  if (pid != 0)
  {
    FLOW_LOG_INFO("Unix_child [" << *this << "]: Killing child PID [" << pid << "] and reaping it.");
    ::kill(pid, SIGKILL);
    int status;
    while ((::waitpid(pid, &status, 0) == -1) && (errno == EINTR))
    {
      // Retry.
    }
    m_child_pid = 0;
  }

  Error_code sys_err_code;
  m_peer.close(sys_err_code);
  if (m_acceptor)
  {
    m_acceptor->close(sys_err_code);
  }
  m_accept_timer.cancel();
  m_sigchld.cancel(sys_err_code);

  fs::remove(m_config.m_sock_path, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unix_child [" << *this << "]: Could not remove socket file; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }

  FLOW_LOG_INFO("Unix_child [" << *this << "]: Stopped.");
} // Unix_child::stop()

void Unix_child::set_start_result(const Error_code& result)
{
  if (!m_start_result_set.exchange(true))
  {
    m_start_result.set_value(result);
  }
}

util::process_id_t Unix_child::child_pid() const
{
  return m_child_pid;
}

const Unix_child::Config& Unix_child::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, const Unix_child& val)
{
  return os << '[' << val.config().m_sock_path.string() << "]@" << static_cast<const void*>(&val);
}

} // namespace blex::transport

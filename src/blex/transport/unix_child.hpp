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
#pragma once

#include "blex/transport/asio_local_stream_socket_fwd.hpp"
#include "blex/util/sync_queue.hpp"
#include "blex/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/thread/future.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <queue>
#include <string>
#include <vector>

namespace blex::transport
{

// Types.

/**
 * Runs one host process (the child) and the local stream-socket connection over which we exchange messages
 * with it.  One Unix_child object corresponds to one child lifetime: start() it once, stop() it once (or let the
 * dtor do it); a new attempt needs a new object.
 *
 * ### Wire framing ###
 * In both directions each message is a 4-byte little-endian length `N` followed by `N` bytes of body.
 * `N == 0` and `N > Config::m_max_msg_size` are protocol violations.
 *
 * ### Interface ###
 * Inbound bodies are obtained, in order, via blocking from_child().  Outbound bodies are given to to_child()
 * which never blocks; the framed bytes go out in order in the background.  The first fatal condition (child
 * process exit, socket error, framing violation) is reported exactly once via blocking err_child(); after that
 * no more inbound bodies arrive.  stop() makes any blocked from_child() / err_child() return `false`.
 *
 * ### Internals ###
 * All socket, timer and signal work happens in the worker thread W (#m_worker) via boost.asio.  The only
 * blocking W ever does is pushing onto the bounded inbound queue, which is how back-pressure from a slow
 * consumer reaches the socket.
 *
 * ### Thread safety ###
 * start(), stop() and to_child() may be called from any thread, concurrently with each other (stop() is the
 * way to abort a start() that is waiting for the child to connect).  from_child() and err_child() are meant to
 * be called each from one consumer thread.
 */
class Unix_child :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// What to run and how to talk to it.
  struct Config
  {
    /// Path of the listening socket; removed before listening and again on stop().
    fs::path m_sock_path;

    /// Child executable.
    fs::path m_child_path;

    /// Arguments passed to the child after its `argv[0]`.
    std::vector<std::string> m_child_args;

    /// See class doc header.
    size_t m_max_msg_size;

    /// Max number of inbound bodies buffered before the socket reader waits for from_child().
    size_t m_rcv_depth;

    /// How long the child has to connect after being spawned.
    util::Fine_duration m_accept_timeout;
  }; // struct Config

  // Constants.

  /// Size of the length prefix of each message.
  static constexpr size_t S_HDR_SIZE = 4;

  // Constructors/destructor.

  /**
   * Constructs the object.  Nothing is spawned or opened until start().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param config
   *        See Config.
   */
  explicit Unix_child(flow::log::Logger* logger_ptr, const Config& config);

  /// Acts as if stop() was called.
  ~Unix_child();

  // Methods.

  /**
   * Listens on Config::m_sock_path, spawns the child and waits for it to connect.  Returns once connected
   * (reading then proceeds in the background) or failed.  On failure everything has been cleaned up as if
   * by stop().
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CHILD_START_FAILED (could not listen, or could not execute the child),
   *        error::Code::S_CHILD_ACCEPT_TIMEOUT (child did not connect within Config::m_accept_timeout),
   *        error::Code::S_CHILD_FAILED (child exited before connecting),
   *        error::Code::S_XPORT_STOPPED (stop() was called meanwhile or before).
   */
  void start(Error_code* err_code = 0);

  /**
   * Blocks until the next inbound body is available and moves it into `*target`.
   *
   * @param target
   *        Destination.
   * @return `true` on success; `false` if stop() has been called.
   */
  bool from_child(util::Blob* target);

  /**
   * Blocks until the (single) fatal error is available and loads it into `*target`.
   * The error is error::Code::S_CHILD_FAILED or error::Code::S_MESSAGE_SIZE_EXCEEDED; the underlying detail
   * (exit status, socket error) is logged.
   *
   * @param target
   *        Destination.
   * @return `true` on success; `false` if stop() has been called.
   */
  bool err_child(Error_code* target);

  /**
   * Queues one body to be framed and written to the child.  Does not block.  A write failure is reported
   * via err_child().
   *
   * @param blob
   *        Body; moved-from on success.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_XPORT_NOT_STARTED (start() has not succeeded, or stop() has been called),
   *        error::Code::S_MESSAGE_SIZE_EXCEEDED (`blob` is empty or larger than Config::m_max_msg_size).
   */
  void to_child(util::Blob&& blob, Error_code* err_code = 0);

  /**
   * Kills the child, closes the socket connection, joins thread W and removes the socket file.  Any blocked
   * from_child() / err_child() returns `false`; as does any later one.  Idempotent.
   */
  void stop();

  /**
   * PID of the running child; 0 if none (not spawned yet, already reaped, or stopped).
   * @return See above.
   */
  util::process_id_t child_pid() const;

  /**
   * Config from ctor.
   * @return See above.
   */
  const Config& config() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  /// Framed outbound message: header plus body.  Shared so it can ride inside a copyable task.
  using Frame_ptr = std::shared_ptr<util::Blob>;

  // Methods.

  /// In thread W: listens, spawns and begins the accept and its timeout.  Result goes to set_start_result().
  void start_in_worker();

  /**
   * In thread W: `fork()`s and `execv()`s the child.  On success #m_child_pid is set.
   *
   * @param err_code
   *        Set to the system error on failure (including `execv()` failure inside the child).
   */
  void spawn_child(Error_code* err_code);

  /**
   * In thread W: `async_accept()` completion handler.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_accept(const Error_code& sys_err_code);

  /**
   * In thread W: accept-timeout completion handler.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_accept_timeout(const Error_code& sys_err_code);

  /// In thread W: (re)arms the `SIGCHLD` wait.
  void await_child_exit();

  /**
   * In thread W: `SIGCHLD` handler.  Reaps our child if it is the one that exited.  A child that can no longer
   * be waited for (reaped by someone else in this process) is gone all the same and is reported like any exit.
   *
   * @param async_err_code
   *        Result.
   */
  void on_sigchld(const Error_code& async_err_code);

  /// In thread W: begins reading the next message header.
  void read_hdr();

  /**
   * In thread W: header read completion handler.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_hdr(const Error_code& sys_err_code);

  /**
   * In thread W: body read completion handler.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_body(const Error_code& sys_err_code);

  /// In thread W: begins writing the frame at the front of #m_snd_q.
  void write_next();

  /**
   * In thread W: frame write completion handler.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_write(const Error_code& sys_err_code);

  /**
   * In thread W: handles a fatal condition after connection: reports `cause` via err_child() (first time only)
   * and closes the connection.
   *
   * @param cause
   *        Error to report.
   * @param context
   *        Describes what failed, for logging.
   */
  void fail(const Error_code& cause, util::String_view context);

  /**
   * Completes the future start() waits on.  Only the first call has any effect.
   *
   * @param result
   *        Falsy on success.
   */
  void set_start_result(const Error_code& result);

  // Data.

  /// See config().
  const Config m_config;

  /// Protects start() against concurrent stop().
  mutable Mutex m_lifecycle_mutex;

  /// Set by the first stop().  Protected by #m_lifecycle_mutex.
  bool m_stopped;

  /// Whether start() succeeded and stop() has not been called.  Checked by to_child().
  std::atomic<bool> m_running;

  /// Thread W.  Declared before the boost.asio objects that live on its engine so that it outlives them.
  flow::async::Single_thread_task_loop m_worker;

  /// Listening socket; null until start_in_worker(); closed once the child connects.  Thread W only.
  std::unique_ptr<asio_local_stream_socket::Acceptor> m_acceptor;

  /// Connection with the child.  Thread W only (and stop() after W is joined).
  asio_local_stream_socket::Peer_socket m_peer;

  /// Fires if the child fails to connect in time.  Thread W only.
  flow::util::Timer m_accept_timer;

  /// Delivers `SIGCHLD`.  Thread W only.
  boost::asio::signal_set m_sigchld;

  /// PID of the child; 0 if none.  Written in W during start and after reaping; read by child_pid().
  std::atomic<util::process_id_t> m_child_pid;

  /// Whether the accept phase has concluded one way or another.  Thread W only.
  bool m_accept_done;

  /// Whether fail() has been called.  Thread W only.
  bool m_failed;

  /// Guards #m_start_result against being set twice.
  std::atomic<bool> m_start_result_set;

  /// What start() waits on.
  boost::promise<Error_code> m_start_result;

  /// Target of the header read in progress.  Thread W only.
  std::array<uint8_t, S_HDR_SIZE> m_rcv_hdr;

  /// Target of the body read in progress.  Thread W only.
  util::Blob m_rcv_body;

  /// Frames not yet fully written, oldest (the one being written) at front.  Thread W only.
  std::queue<Frame_ptr> m_snd_q;

  /// Inbound bodies; see from_child().
  util::Sync_queue<util::Blob> m_from_child;

  /// Fatal error; see err_child().
  util::Sync_queue<Error_code> m_err_child;
}; // class Unix_child

// Free functions.

/**
 * Prints string representation of the given Unix_child to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Unix_child& val);

} // namespace blex::transport

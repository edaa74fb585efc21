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

#include "blex/transport/xport_config.hpp"
#include "blex/transport/ble_dispatcher.hpp"
#include "blex/session/session_fwd.hpp"
#include "blex/util/atomic_state.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <atomic>
#include <memory>
#include <optional>

namespace blex::transport
{

// Types.

/**
 * The BLE transport: owns the host process and the socket connection to it, keeps host and controller in sync,
 * routes inbound messages to listeners via dispatcher(), and recovers from failure by rebuilding the whole
 * pipeline.
 *
 * ### Lifecycle ###
 * state() moves only along STOPPED -> STARTING -> STARTED -> STOPPING -> STOPPED, or STARTING -> STOPPING
 * (a failed attempt).  Every transition is a compare-and-swap on one atomic cell, so among concurrent would-be
 * movers exactly one wins.
 *
 * start() runs one attempt:
 *   -# Unregister all listeners left from any previous attempt.
 *   -# Spawn the host (Unix_child) and wait for it to connect.
 *   -# Spawn the error-forwarding task (child failure -> shutdown) and the receive task (child bytes ->
 *      Ble_dispatcher::dispatch()).
 *   -# Sync handshake: register the standing sync-event listener; send a sync query; if the host reports not-synced
 *      wait for a `synced == true` sync event, up to Xport_config::m_sync_timeout.
 *   -# Spawn the sync-loss watcher (`synced == false` event -> shutdown with error::Code::S_SYNC_LOST).
 *   -# STARTING -> STARTED.
 *
 * Any failure along the way shuts the attempt down and is returned to the start() caller.  If start() succeeds the
 * restart supervisor is armed: whenever the transport later shuts down due to a failure (not stop()), and
 * Xport_config::m_restart is set, it waits Xport_config::m_restart_delay and runs another attempt, repeating
 * (with the same delay) until one succeeds or stop() / start() is called.  Those attempts' failures are only
 * logged and counted; see restart_status().
 *
 * ### Shutdown ###
 * One routine tears an attempt down, whoever triggers it (a failed start step, a child failure, sync loss,
 * stop(), the dtor):
 *   -# Win the STARTED/STARTING -> STOPPING transition, or return (someone else is on it).
 *   -# Stop the Unix_child: the child is killed, and the queues the receive and error tasks block on are closed.
 *   -# Ble_dispatcher::error_all() with the cause, releasing every listener, including the sync-loss watcher's.
 *   -# Join all of the attempt's task threads.
 *   -# STOPPING -> STOPPED.
 *   -# If the attempt had reached STARTED, signal the restart supervisor (which ignores it if the shutdown was
 *      requested via stop()).
 *
 * A task thread that detects a failure never runs this routine itself (it would have to join itself); it posts it
 * onto a dedicated long-lived thread.
 *
 * ### Threads ###
 * Per attempt: Unix_child's worker; the receive task; the error-forwarding task; the sync-loss watcher.  Per
 * transport: the shutdown thread and the restart supervisor thread.
 *
 * ### Thread safety ###
 * All public methods may be called concurrently.  Do not call stop() or the dtor from a listener-owning thread
 * that the transport itself runs (there are none exposed to the user, so this is only a concern for future
 * callbacks).
 */
class Ble_xport :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Lifecycle state; see class doc header.
  enum class State
  {
    /// Not running; start() may be called.
    S_STOPPED = 0,
    /// An attempt is in progress.
    S_STARTING,
    /// Running; tx() works.
    S_STARTED,
    /// Being torn down.
    S_STOPPING
  };

  /// Observable state of the restart supervisor.
  struct Restart_status
  {
    /// Whether the supervisor is armed: start() succeeded, and neither stop() nor a newer start() came since.
    bool m_active;

    /// Number of automatic restart attempts made since the last start().
    uint64_t m_n_attempts;

    /// How many of #m_n_attempts failed.
    uint64_t m_n_failures;

    /// Error of the most recent failed automatic restart attempt; falsy if none.
    Error_code m_last_err;
  }; // struct Restart_status

  // Constructors/destructor.

  /**
   * Constructs a stopped transport.  Nothing is spawned until start().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param config
   *        Settings; copied.
   */
  explicit Ble_xport(flow::log::Logger* logger_ptr, const Xport_config& config);

  /// Disarms the restart supervisor, stops the transport as if by stop(), and joins all threads.
  ~Ble_xport();

  // Methods.

  /**
   * Runs one start attempt (see class doc header) and, on success, arms the restart supervisor.  Blocks until
   * the attempt finishes.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_XPORT_STARTED_TWICE (state() is not STOPPED; nothing was changed),
   *        error::Code::S_CHILD_START_FAILED, error::Code::S_CHILD_ACCEPT_TIMEOUT, error::Code::S_CHILD_FAILED,
   *        error::Code::S_SYNC_TIMEOUT, error::Code::S_XPORT_STOPPED (stop() was called meanwhile),
   *        error::Code::S_INTERNAL_ERROR_UNEXPECTED_STATE; or whatever else shut the attempt down
   *        (e.g., error::Code::S_MESSAGE_SIZE_EXCEEDED).
   */
  void start(Error_code* err_code = 0);

  /**
   * Shuts the transport down (if running or starting) with no restart, and disarms the restart supervisor.
   * Listeners blocked at that point receive error::Code::S_XPORT_STOPPED.  Returns after the teardown completes.
   * A no-op if already stopped.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  No error is currently emitted.
   */
  void stop(Error_code* err_code = 0);

  /**
   * Sends one message body to the host.  Does not block.
   *
   * @param blob
   *        Encoded message body (e.g., from encode_msg()); moved-from on success.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_XPORT_NOT_STARTED (state() is not STARTED; nothing was sent),
   *        error::Code::S_MESSAGE_SIZE_EXCEEDED.
   */
  void tx(util::Blob&& blob, Error_code* err_code = 0);

  /**
   * Advisory per-request response timeout, for layers above; Xport_config::m_rsp_timeout.
   * @return See above.
   */
  util::Fine_duration rsp_timeout() const;

  /**
   * Current lifecycle state.
   * @return See above.
   */
  State state() const;

  /**
   * Returns a fresh sequence number for a request: 1, 2, 3, ... for this transport; see next_seq_after().
   * @return See above.
   */
  seq_t next_seq();

  /**
   * The dispatcher through which callers register listeners for inbound messages.
   * @return See above; valid for the lifetime of `*this`.
   */
  Ble_dispatcher* dispatcher();

  /**
   * Snapshot of the restart supervisor's state.
   * @return See above.
   */
  Restart_status restart_status() const;

  /**
   * Creates a management session over this transport; see session::build_session().
   *
   * @param cfg
   *        Session settings.
   * @param err_code
   *        See session::build_session().
   * @return See session::build_session().
   */
  std::unique_ptr<session::Session> build_session(const session::Session_config& cfg, Error_code* err_code = 0);

  /**
   * Config from ctor.
   * @return See above.
   */
  const Xport_config& config() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  /// Short-hand for the restart-supervisor generation; bumped by start() and stop() to disarm older supervisors.
  using generation_t = uint64_t;

  struct Attempt;

  // Methods.

  /**
   * Runs one start attempt (steps in class doc header).  On failure, shuts the attempt down first.
   *
   * @param generation
   *        None if this is start(): a new generation begins (disarming any older supervisor).  Otherwise
   *        the supervisor generation this restart attempt belongs to; if #m_generation has changed by the time
   *        the attempt is installed, the attempt is abandoned with error::Code::S_XPORT_STOPPED.
   * @param err_code
   *        Not null.  See start().
   */
  void start_once(std::optional<generation_t> generation, Error_code* err_code);

  /**
   * Sync handshake of start_once(): returns once synced or failed.
   *
   * @param attempt
   *        The attempt.
   * @param err_code
   *        Not null.  error::Code::S_SYNC_TIMEOUT; or the error delivered to the sync listener.
   */
  void await_sync(Attempt* attempt, Error_code* err_code);

  /**
   * Sends a sync query and awaits its response, up to `deadline`.
   *
   * @param deadline
   *        When to give up with error::Code::S_SYNC_TIMEOUT.
   * @param err_code
   *        Not null.
   * @return Whether the host reports being synced.  Meaningless on error.
   */
  bool query_synced(const util::Fine_time_pt& deadline, Error_code* err_code);

  /**
   * tx() without the STARTED check; used by the handshake.
   *
   * @param blob
   *        See tx().
   * @param err_code
   *        Not null.
   */
  void tx_impl(util::Blob&& blob, Error_code* err_code);

  /**
   * Body of the error-forwarding task: waits for the child's fatal error and has the attempt shut down with it.
   *
   * @param attempt
   *        The attempt.
   */
  void err_task(Attempt* attempt);

  /**
   * Body of the receive task: feeds inbound bodies to the dispatcher until the child is stopped.
   *
   * @param attempt
   *        The attempt.
   */
  void rcv_task(Attempt* attempt);

  /**
   * Body of the sync-loss watcher.
   *
   * @param attempt
   *        The attempt.
   */
  void sync_watch_task(Attempt* attempt);

  /**
   * From a task thread: has the given attempt shut down (with restart) on the shutdown thread; a no-op if by then
   * it is no longer the current one.
   *
   * @param attempt_id
   *        `Attempt::m_id`.
   * @param cause
   *        Truthy error.
   */
  void post_shutdown(uint64_t attempt_id, const Error_code& cause);

  /**
   * The shutdown routine (see class doc header).
   *
   * @param restart
   *        Whether the restart supervisor should be signaled (if the attempt had fully started).
   * @param cause
   *        Error delivered to all listeners.
   * @param only_attempt_id
   *        If not 0: do nothing unless the current attempt has this `Attempt::m_id`.
   */
  void shutdown(bool restart, const Error_code& cause, uint64_t only_attempt_id = 0);

  /**
   * In the supervisor thread: reacts to a shutdown of a fully started attempt.
   *
   * @param restart
   *        `restart` arg of shutdown().
   * @param generation
   *        #m_generation as of that shutdown.
   */
  void on_shutdown_done(bool restart, generation_t generation);

  /**
   * In the supervisor thread: schedules restart_attempt() after Xport_config::m_restart_delay.
   *
   * @param generation
   *        See on_shutdown_done().
   */
  void schedule_restart(generation_t generation);

  /**
   * In the supervisor thread: one automatic restart attempt; reschedules itself on failure.
   *
   * @param generation
   *        See on_shutdown_done().
   */
  void restart_attempt(generation_t generation);

  /**
   * Sets Restart_status::m_active to `false` and logs.
   *
   * @param why
   *        For logging.
   */
  void deactivate_supervisor(util::String_view why);

  // Data.

  /// See config().
  const Xport_config m_config;

  /// See state().
  util::Atomic_state<State> m_state;

  /// See dispatcher().
  Ble_dispatcher m_dispatcher;

  /// Last value returned by next_seq().
  std::atomic<seq_t> m_last_seq;

  /// See #generation_t.
  std::atomic<generation_t> m_generation;

  /// `Attempt::m_id` of the next attempt.
  std::atomic<uint64_t> m_next_attempt_id;

  /// Protects #m_attempt; held throughout shutdown() teardown, so at most one teardown runs at a time.
  mutable Mutex m_attempt_mutex;

  /// Resources of the current attempt; null when STOPPED.  Protected by #m_attempt_mutex.
  std::shared_ptr<Attempt> m_attempt;

  /// Protects #m_restart_status.
  mutable Mutex m_restart_status_mutex;

  /// See restart_status().  Protected by #m_restart_status_mutex.
  Restart_status m_restart_status;

  /// Runs shutdown() on behalf of task threads.
  flow::async::Single_thread_task_loop m_shutdown_loop;

  /// The restart supervisor.
  flow::async::Single_thread_task_loop m_restarter;
}; // class Ble_xport

// Free functions.

/**
 * Prints string representation of the given state to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Ble_xport::State val);

/**
 * Prints string representation of the given transport to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ble_xport& val);

} // namespace blex::transport

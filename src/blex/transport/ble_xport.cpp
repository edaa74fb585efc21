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
#include "blex/transport/ble_xport.hpp"
#include "blex/transport/unix_child.hpp"
#include "blex/transport/error.hpp"
#include "blex/session/session.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <boost/chrono/round.hpp>

namespace blex::transport
{

// Types.

/// Everything that exists for the duration of one start attempt and is torn down by Ble_xport::shutdown().
struct Ble_xport::Attempt :
  private boost::noncopyable
{
  // Constructors/destructor.

  /**
   * Creates the (not yet started) child session and task loops.
   *
   * @param logger_ptr
   *        Logger.
   * @param id
   *        See #m_id.
   * @param child_config
   *        For #m_child.
   */
  explicit Attempt(flow::log::Logger* logger_ptr, uint64_t id, const Unix_child::Config& child_config);

  /**
   * Stops the child and releases the sync watcher, then joins the task loops.  Normally shutdown() has done all
   * of this already; then it is a no-op.
   */
  ~Attempt();

  // Methods.

  /**
   * What the attempt was shut down for; error::Code::S_XPORT_STOPPED if nothing more specific was recorded.
   * Call only with Ble_xport::m_attempt_mutex locked, once the attempt is no longer current.
   *
   * @return See above.
   */
  Error_code shutdown_cause() const;

  // Data.

  /// Distinguishes attempts of one transport: 1, 2, ....
  const uint64_t m_id;

  /// The host process and our connection to it.
  Unix_child m_child;

  /// Runs Ble_xport::err_task().
  flow::async::Single_thread_task_loop m_err_loop;

  /// Runs Ble_xport::rcv_task().
  flow::async::Single_thread_task_loop m_rcv_loop;

  /// Runs Ble_xport::sync_watch_task().
  flow::async::Single_thread_task_loop m_sync_watch_loop;

  /// Standing listener for sync events; null until registered.  Protected by Ble_xport::m_attempt_mutex.
  std::shared_ptr<Ble_listener> m_sync_evt_listener;

  /// Error given to shutdown(); falsy until then.  Protected by Ble_xport::m_attempt_mutex.
  Error_code m_shutdown_cause;
}; // struct Ble_xport::Attempt

// Local constants.

namespace
{

/// Selector of the standing sync-event listener.
const Msg_base S_SYNC_EVT_SELECTOR{ Msg_op::S_EVT, Msg_type::S_SYNC_EVT,
                                    Msg_base::S_SEQ_NONE, Msg_base::S_CONN_HANDLE_NONE };

} // namespace (anonymous)

// Implementations.

Ble_xport::Attempt::Attempt(flow::log::Logger* logger_ptr, uint64_t id, const Unix_child::Config& child_config) :
  m_id(id),
  m_child(logger_ptr, child_config),
  m_err_loop(logger_ptr, flow::util::ostream_op_string("BLEX-err-", id)),
  m_rcv_loop(logger_ptr, flow::util::ostream_op_string("BLEX-rcv-", id)),
  m_sync_watch_loop(logger_ptr, flow::util::ostream_op_string("BLEX-sync-", id))
{
  // That's it.
}

Ble_xport::Attempt::~Attempt()
{
  // The loops' tasks block on m_child and the sync listener; so release those before the loops are joined.
  m_child.stop();
  if (m_sync_evt_listener && (!m_shutdown_cause))
  {
    m_sync_evt_listener->on_error(error::Code::S_XPORT_STOPPED);
  }
  m_err_loop.stop();
  m_rcv_loop.stop();
  m_sync_watch_loop.stop();
}

Error_code Ble_xport::Attempt::shutdown_cause() const
{
  return m_shutdown_cause ? m_shutdown_cause : Error_code(error::Code::S_XPORT_STOPPED);
}

Ble_xport::Ble_xport(flow::log::Logger* logger_ptr, const Xport_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_config(config),
  m_state(State::S_STOPPED),
  m_dispatcher(get_logger()),
  m_last_seq(0),
  m_generation(0),
  m_next_attempt_id(1),
  m_restart_status{ false, 0, 0, Error_code() },
  m_shutdown_loop(get_logger(), "BLEX-shutdown"),
  m_restarter(get_logger(), "BLEX-restart")
{
  using flow::async::reset_this_thread_pinning;

  m_shutdown_loop.start(reset_this_thread_pinning);
  m_restarter.start(reset_this_thread_pinning);

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Created; config [" << m_config << "].");
}

Ble_xport::~Ble_xport()
{
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Shutting down.  Will stop transport and join supervisor threads.");

  stop();
  /* Any attempt still in progress on the supervisor thread was either torn down by stop() or will see the
   * generation change before installing itself; so these joins are bounded by the attempt timeouts at worst. */
  m_shutdown_loop.stop();
  m_restarter.stop();
}

void Ble_xport::start(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Ble_xport::start()"))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Start requested.");
  start_once(std::nullopt, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Error starting BLE transport [" << *err_code << "] "
                     "[" << err_code->message() << "].  Not retrying.");
    return;
  }
  // else

  {
    Lock lock(m_restart_status_mutex);
    m_restart_status = Restart_status{ m_config.m_restart, 0, 0, Error_code() };
  }
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Started.  Restart supervisor "
                "[" << (m_config.m_restart ? "armed" : "disabled by config") << "].");
} // Ble_xport::start()

void Ble_xport::stop(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { stop(actual_err_code); },
         err_code, "Ble_xport::stop()"))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Stop requested (state [" << state() << "]).");

  // Disarm the supervisor first, so nothing it has pending can bring us back up.
  ++m_generation;
  deactivate_supervisor("stop() requested");

  shutdown(false, error::Code::S_XPORT_STOPPED);
  err_code->clear();
}

void Ble_xport::start_once(std::optional<generation_t> generation, Error_code* err_code)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  assert(err_code);

  /* Under one lock: the generation check, the claim of STARTING, and installing the attempt.  So a superseded
   * restart never touches the state; and shutdown() (same lock) always finds the attempt owning a STARTING state. */
  std::shared_ptr<Attempt> attempt;
  {
    Lock lock(m_attempt_mutex);

    if (generation && (*generation != m_generation))
    {
      FLOW_LOG_INFO("Ble_xport [" << *this << "]: Restart attempt superseded by stop() or start(); abandoning.");
      *err_code = error::Code::S_XPORT_STOPPED;
      return;
    }
    // else
    if (!m_state.compare_exchange(State::S_STOPPED, State::S_STARTING))
    {
      FLOW_LOG_WARNING("Ble_xport [" << *this << "]: BLE xport started twice: state is [" << state() << "], "
                       "not STOPPED.");
      *err_code = error::Code::S_XPORT_STARTED_TWICE;
      return;
    }
    // else
    if (!generation)
    {
      ++m_generation; // A fresh start() disarms any older supervisor.
    }

    // No stale selector from a previous attempt may block (or swallow messages for) this one.
    m_dispatcher.clear();

    Unix_child::Config child_config{ m_config.m_sock_path, m_config.m_child_path,
                                     { m_config.m_dev_path, m_config.m_sock_path.string() },
                                     m_config.m_max_msg_size, m_config.m_rcv_depth, m_config.m_accept_timeout };
    attempt = std::make_shared<Attempt>(get_logger(), m_next_attempt_id++, child_config);
    m_attempt = attempt;
  } // Lock lock(m_attempt_mutex);

  const auto id = attempt->m_id;
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Attempt [" << id << "]: Starting host process.");

  Error_code child_err_code;
  attempt->m_child.start(&child_err_code);
  if (child_err_code)
  {
    if (child_err_code == error::Code::S_CHILD_ACCEPT_TIMEOUT)
    {
      FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << id << "]: Host process did not connect to "
                       "socket within [" << round<milliseconds>(m_config.m_accept_timeout) << "]; "
                       "controller not attached?");
    }
    else
    {
      FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << id << "]: Failed to start host process "
                       "[" << child_err_code << "] [" << child_err_code.message() << "].");
    }
    shutdown(true, child_err_code, id);
    *err_code = child_err_code;
    return;
  }
  // else
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Attempt [" << id << "]: Host process PID "
                "[" << attempt->m_child.child_pid() << "] connected; checking sync with controller.");

  {
    Lock lock(m_attempt_mutex);
    if (m_attempt != attempt)
    {
      *err_code = attempt->shutdown_cause();
      return;
    }
    // else

    attempt->m_err_loop.start(flow::async::reset_this_thread_pinning);
    attempt->m_err_loop.post([this, attempt_raw = attempt.get()]() { err_task(attempt_raw); });
    attempt->m_rcv_loop.start(flow::async::reset_this_thread_pinning);
    attempt->m_rcv_loop.post([this, attempt_raw = attempt.get()]() { rcv_task(attempt_raw); });
  }

  Error_code sync_err_code;
  await_sync(attempt.get(), &sync_err_code);
  if (sync_err_code)
  {
    FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << id << "]: Sync handshake failed "
                     "[" << sync_err_code << "] [" << sync_err_code.message() << "].");
    shutdown(true, sync_err_code, id);
    *err_code = sync_err_code;
    return;
  }
  // else

  {
    Lock lock(m_attempt_mutex);
    if (m_attempt != attempt)
    {
      *err_code = attempt->shutdown_cause();
      return;
    }
    // else

    attempt->m_sync_watch_loop.start(flow::async::reset_this_thread_pinning);
    attempt->m_sync_watch_loop.post([this, attempt_raw = attempt.get()]() { sync_watch_task(attempt_raw); });
  }

  if (!m_state.compare_exchange(State::S_STARTING, State::S_STARTED))
  {
    {
      Lock lock(m_attempt_mutex);
      if (m_attempt != attempt)
      {
        // A shutdown beat us to it: that's not unexpected; report what it was about.
        *err_code = attempt->shutdown_cause();
        return;
      }
    }
    FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << id << "]: Internal error: BLE transport in "
                     "unexpected state [" << state() << "].");
    shutdown(true, error::Code::S_INTERNAL_ERROR_UNEXPECTED_STATE, id);
    *err_code = error::Code::S_INTERNAL_ERROR_UNEXPECTED_STATE;
    return;
  }
  // else

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Attempt [" << id << "]: Host and controller synced.  Started.");
  err_code->clear();
} // Ble_xport::start_once()

void Ble_xport::await_sync(Attempt* attempt, Error_code* err_code)
{
  using flow::Fine_clock;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  const auto deadline = Fine_clock::now() + m_config.m_sync_timeout;

  // Register for sync events before asking, so a sync event racing with the response is not lost.
  auto listener = std::make_shared<Ble_listener>(get_logger(), "sync-evt");
  m_dispatcher.add_listener(S_SYNC_EVT_SELECTOR, listener, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  {
    Lock lock(m_attempt_mutex);
    if (m_attempt.get() != attempt)
    {
      // Torn down before it could see this listener; so it was not released by error_all().
      *err_code = attempt->shutdown_cause();
      m_dispatcher.remove_listener(S_SYNC_EVT_SELECTOR);
      return;
    }
    // else
    attempt->m_sync_evt_listener = listener;
  }

  const bool synced = query_synced(deadline, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  if (synced)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Host reports being synced with controller already.");
    return;
  }
  // else

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Host not yet synced with controller; awaiting sync event for up to "
                "[" << round<milliseconds>(deadline - Fine_clock::now()) << "].");
  while (true)
  {
    const auto now = Fine_clock::now();
    if (now >= deadline)
    {
      *err_code = error::Code::S_SYNC_TIMEOUT;
      return;
    }
    // else

    Ble_msg msg;
    listener->timed_await(&msg, deadline - now, err_code);
    if (*err_code == error::Code::S_TIMEOUT)
    {
      *err_code = error::Code::S_SYNC_TIMEOUT;
    }
    if (*err_code)
    {
      return;
    }
    // else

    const auto evt_synced = msg.synced();
    if (evt_synced && *evt_synced)
    {
      FLOW_LOG_INFO("Ble_xport [" << *this << "]: Sync event reports host synced with controller.");
      return;
    }
    // else
    FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Sync event [" << msg.base() << "] does not report synced; "
                   "still waiting.");
  } // while (true)
} // Ble_xport::await_sync()

bool Ble_xport::query_synced(const util::Fine_time_pt& deadline, Error_code* err_code)
{
  using flow::Fine_clock;

  const auto seq = next_seq();
  const Msg_base selector{ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, seq, Msg_base::S_CONN_HANDLE_NONE };
  auto listener = std::make_shared<Ble_listener>(get_logger(), flow::util::ostream_op_string("sync-query-", seq));

  m_dispatcher.add_listener(selector, listener, err_code);
  if (*err_code)
  {
    return false;
  }
  // else

  bool synced = false;
  tx_impl(encode_sync_req(get_logger(), seq), err_code);
  while (!*err_code)
  {
    const auto now = Fine_clock::now();
    if (now >= deadline)
    {
      *err_code = error::Code::S_SYNC_TIMEOUT;
      break;
    }
    // else

    Ble_msg msg;
    listener->timed_await(&msg, deadline - now, err_code);
    if (*err_code == error::Code::S_TIMEOUT)
    {
      *err_code = error::Code::S_SYNC_TIMEOUT;
    }
    if (*err_code)
    {
      break;
    }
    // else

    const auto rsp_synced = msg.synced();
    if ((msg.base().m_op == Msg_op::S_RSP) && (msg.base().m_type == Msg_type::S_SYNC) && rsp_synced)
    {
      synced = *rsp_synced;
      FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Sync query [" << seq << "] answered: synced [" << synced << "].");
      break;
    }
    // else
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Ignoring unexpected message [" << msg.base() << "] answering "
                  "sync query [" << seq << "].");
  } // while (!*err_code)

  m_dispatcher.remove_listener(selector);
  return synced;
} // Ble_xport::query_synced()

void Ble_xport::tx(util::Blob&& blob, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { tx(std::move(blob), actual_err_code); },
         err_code, "Ble_xport::tx()"))
  {
    return;
  }
  // else

  const auto cur_state = state();
  if (cur_state != State::S_STARTED)
  {
    FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt to transmit before BLE xport fully started; "
                     "state [" << cur_state << "].");
    *err_code = error::Code::S_XPORT_NOT_STARTED;
    return;
  }
  // else

  tx_impl(std::move(blob), err_code);
}

void Ble_xport::tx_impl(util::Blob&& blob, Error_code* err_code)
{
  FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Tx to host: size [" << blob.size() << "].");
  FLOW_LOG_DATA("Ble_xport [" << *this << "]: Tx contents:\n" << util::hex_dump(util::blob_view(blob)));

  std::shared_ptr<Attempt> attempt;
  {
    Lock lock(m_attempt_mutex);
    attempt = m_attempt;
  }
  if (!attempt)
  {
    *err_code = error::Code::S_XPORT_NOT_STARTED;
    return;
  }
  // else

  attempt->m_child.to_child(std::move(blob), err_code);
}

void Ble_xport::err_task(Attempt* attempt)
{
  // We are in the attempt's error-forwarding thread.
  Error_code child_err_code;
  if (!attempt->m_child.err_child(&child_err_code))
  {
    FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Attempt [" << attempt->m_id << "]: Error-forwarding task "
                   "exiting: child stopped.");
    return;
  }
  // else

  FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << attempt->m_id << "]: BLE transport error "
                   "[" << child_err_code << "] [" << child_err_code.message() << "].");
  post_shutdown(attempt->m_id, child_err_code);
}

void Ble_xport::rcv_task(Attempt* attempt)
{
  // We are in the attempt's receive thread.
  util::Blob blob;
  while (attempt->m_child.from_child(&blob))
  {
    m_dispatcher.dispatch(util::blob_view(blob));
  }
  FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Attempt [" << attempt->m_id << "]: Receive task exiting: "
                 "child stopped.");
}

void Ble_xport::sync_watch_task(Attempt* attempt)
{
  // We are in the attempt's sync-watch thread.  The listener was set before this thread was started.
  const auto listener = attempt->m_sync_evt_listener;
  assert(listener);

  while (true)
  {
    Ble_msg msg;
    Error_code listener_err_code;
    listener->await(&msg, &listener_err_code);
    if (listener_err_code)
    {
      FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Attempt [" << attempt->m_id << "]: Sync watcher got "
                     "[" << listener_err_code << "]; exiting.");
      post_shutdown(attempt->m_id, listener_err_code); // Typically no-op: this came from error_all() in shutdown.
      return;
    }
    // else

    const auto synced = msg.synced();
    if (synced && (!*synced))
    {
      FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Attempt [" << attempt->m_id << "]: BLE host <-> "
                       "controller sync lost.");
      post_shutdown(attempt->m_id, error::Code::S_SYNC_LOST);
    }
  } // while (true)
}

void Ble_xport::post_shutdown(uint64_t attempt_id, const Error_code& cause)
{
  m_shutdown_loop.post([this, attempt_id, cause]()
  {
    shutdown(true, cause, attempt_id);
  });
}

void Ble_xport::shutdown(bool restart, const Error_code& cause, uint64_t only_attempt_id)
{
  Lock lock(m_attempt_mutex);

  if ((only_attempt_id != 0) && ((!m_attempt) || (m_attempt->m_id != only_attempt_id)))
  {
    FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Shutdown of attempt [" << only_attempt_id << "] "
                   "(cause [" << cause << "]) ignored: not the current attempt.");
    return;
  }
  // else

  bool fully_started;
  if (m_state.compare_exchange(State::S_STARTED, State::S_STOPPING))
  {
    fully_started = true;
  }
  else if (m_state.compare_exchange(State::S_STARTING, State::S_STOPPING))
  {
    fully_started = false;
  }
  else
  {
    FLOW_LOG_TRACE("Ble_xport [" << *this << "]: Shutdown (cause [" << cause << "]) ignored: state is "
                   "[" << state() << "].");
    return;
  }

  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Shutting down (fully started? = [" << fully_started << "]; "
                "restart requested? = [" << restart << "]) due to [" << cause << "] [" << cause.message() << "].");

  const auto attempt = std::move(m_attempt);
  assert(!m_attempt);

  // Stop the host process and socket; this also releases the receive and error-forwarding tasks.
  if (attempt)
  {
    attempt->m_shutdown_cause = cause;
    attempt->m_child.stop();
  }

  // Nobody may block forever awaiting a message over a dead transport.  This also releases the sync watcher.
  m_dispatcher.error_all(cause);

  if (attempt)
  {
    attempt->m_err_loop.stop();
    attempt->m_rcv_loop.stop();
    attempt->m_sync_watch_loop.stop();
    if (attempt->m_sync_evt_listener)
    {
      m_dispatcher.remove_listener(S_SYNC_EVT_SELECTOR);
    }
  }

  if (!m_state.compare_exchange(State::S_STOPPING, State::S_STOPPED))
  {
    assert(false && "Only the shutdown that won the transition to STOPPING may leave it.");
  }
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Stopped.");

  if (fully_started)
  {
    const generation_t generation = m_generation;
    m_restarter.post([this, restart, generation]() { on_shutdown_done(restart, generation); });
  }
} // Ble_xport::shutdown()

void Ble_xport::on_shutdown_done(bool restart, generation_t generation)
{
  // We are in the supervisor thread.
  if (!restart)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Shutdown was explicitly requested; not restarting.");
    return;
  }
  // else
  if (!m_config.m_restart)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Restarts disabled by config; staying down.");
    deactivate_supervisor("restarts disabled");
    return;
  }
  // else
  if (generation != m_generation)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Supervisor superseded by stop() or start(); not restarting.");
    return;
  }
  // else

  schedule_restart(generation);
}

void Ble_xport::schedule_restart(generation_t generation)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  // We are in the supervisor thread.
  FLOW_LOG_INFO("Ble_xport [" << *this << "]: Will attempt restart in "
                "[" << round<milliseconds>(m_config.m_restart_delay) << "].");
  m_restarter.schedule_from_now(m_config.m_restart_delay, [this, generation](bool)
  {
    restart_attempt(generation);
  });
}

void Ble_xport::restart_attempt(generation_t generation)
{
  // We are in the supervisor thread.
  if (generation != m_generation)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Scheduled restart superseded by stop() or start(); dropping it.");
    return;
  }
  // else

  {
    Lock lock(m_restart_status_mutex);
    ++m_restart_status.m_n_attempts;
  }

  Error_code err_code;
  start_once(generation, &err_code);
  if (!err_code)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Restart succeeded.");
    return;
  }
  // else

  FLOW_LOG_WARNING("Ble_xport [" << *this << "]: Error restarting BLE transport [" << err_code << "] "
                   "[" << err_code.message() << "].");
  {
    Lock lock(m_restart_status_mutex);
    ++m_restart_status.m_n_failures;
    m_restart_status.m_last_err = err_code;
  }

  if (generation != m_generation)
  {
    return;
  }
  // else
  schedule_restart(generation);
}

void Ble_xport::deactivate_supervisor(util::String_view why)
{
  Lock lock(m_restart_status_mutex);
  if (m_restart_status.m_active)
  {
    FLOW_LOG_INFO("Ble_xport [" << *this << "]: Restart supervisor disarmed: [" << why << "].");
    m_restart_status.m_active = false;
  }
}

util::Fine_duration Ble_xport::rsp_timeout() const
{
  return m_config.m_rsp_timeout;
}

Ble_xport::State Ble_xport::state() const
{
  return m_state.load();
}

seq_t Ble_xport::next_seq()
{
  seq_t last = m_last_seq.load();
  seq_t next;
  do
  {
    next = next_seq_after(last);
  }
  while (!m_last_seq.compare_exchange_weak(last, next));
  return next;
}

Ble_dispatcher* Ble_xport::dispatcher()
{
  return &m_dispatcher;
}

Ble_xport::Restart_status Ble_xport::restart_status() const
{
  Lock lock(m_restart_status_mutex);
  return m_restart_status;
}

std::unique_ptr<session::Session> Ble_xport::build_session(const session::Session_config& cfg,
                                                           Error_code* err_code)
{
  return session::build_session(this, cfg, err_code);
}

const Xport_config& Ble_xport::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, Ble_xport::State val)
{
  switch (val)
  {
  case Ble_xport::State::S_STOPPED:
    return os << "STOPPED";
  case Ble_xport::State::S_STARTING:
    return os << "STARTING";
  case Ble_xport::State::S_STARTED:
    return os << "STARTED";
  case Ble_xport::State::S_STOPPING:
    return os << "STOPPING";
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

std::ostream& operator<<(std::ostream& os, const Ble_xport& val)
{
  return os << '[' << val.config().m_sock_path.string() << "]@" << static_cast<const void*>(&val);
}

} // namespace blex::transport

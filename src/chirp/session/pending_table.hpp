/* chirp
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

#include "chirp/session/message.hpp"
#include "chirp/session/detail/request_state.hpp"
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <optional>
#include <vector>

namespace chirp::session
{

// Types.

/**
 * The bookkeeping of a Session: every in-flight send, every received message still holding a slot, and every
 * outstanding request, each until resolved.  All methods are thread-safe (one mutex); callers never hold the
 * mutex while invoking anything else, and in particular never while resolving a promise.
 *
 * The "take" methods remove and return an entry in one atomic step: whoever takes an entry is the one party that
 * resolves its promise.  That is what guarantees each future is resolved exactly once even when (e.g.) a reply and
 * a timeout race.
 */
class Pending_table :
  private boost::noncopyable
{
public:
  // Types.

  /// Promise behind a Send_future.
  using Send_promise = boost::promise<Message_ptr>;

  /// Promise behind a Release_future.
  using Release_promise = boost::promise<std::optional<Release_key>>;

  /// One in-flight send.
  struct Send_entry
  {
    /// The message being sent, to hand back on completion.
    Message_ptr m_msg;
    /// Its promise.
    boost::shared_ptr<Send_promise> m_promise;
    /// If the send is that of a request, the request; else null.
    detail::Request_state_ptr m_request;
  };

  /// One received message holding a slot.
  struct Release_entry
  {
    /// The message.
    Message_ptr m_msg;
    /// Its promise.
    boost::shared_ptr<Release_promise> m_promise;
    /// Future of #m_promise, handed to everyone asking to release the same message.
    Release_future m_future;
  };

  // Constructors/destructor.

  /// Makes empty table.
  Pending_table();

  // Methods.

  /**
   * Registers a send, unless the same Message object is already being sent.
   *
   * @param entry
   *        The entry.
   * @return The continuation ID under which it is registered (to be carried through the engine); or 0 if the
   *         message is already in flight (nothing registered).
   */
  uint64_t register_send(Send_entry&& entry);

  /**
   * Removes and returns the send registered under the given continuation ID, if any.
   *
   * @param continuation_id
   *        Value returned by register_send().
   * @return See above.
   */
  std::optional<Send_entry> take_send(uint64_t continuation_id);

  /**
   * Removes and returns all sends.
   * @return See above.
   */
  std::vector<Send_entry> take_all_sends();

  /**
   * Registers a received message holding a slot.  No-op returning `false` if one with the same key is already
   * registered.
   *
   * @param key
   *        Key.
   * @param entry
   *        Entry.
   * @return See above.
   */
  bool register_release(const Release_key& key, Release_entry&& entry);

  /**
   * The future of the release registered under the given key; or an invalid (default-cted) future if none.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Release_future release_future(const Release_key& key) const;

  /**
   * Removes and returns the release entry registered under the given key, if any.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  std::optional<Release_entry> take_release(const Release_key& key);

  /**
   * Copies of all release entries (not removed).
   * @return See above.
   */
  std::vector<Release_entry> release_entries() const;

  /**
   * Removes and returns all release entries.
   * @return See above.
   */
  std::vector<Release_entry> take_all_releases();

  /**
   * Registers an outstanding request, unless one with the same identity is outstanding.
   *
   * @param identity
   *        Identity of the request message.
   * @param state
   *        The request.
   * @return `false` if one with the same identity is outstanding (nothing registered).
   */
  bool register_request(const util::Identity& identity, const detail::Request_state_ptr& state);

  /**
   * Removes and returns the request outstanding with the given identity, if any; else null.
   *
   * @param identity
   *        Identity.
   * @return See above.
   */
  detail::Request_state_ptr take_request(const util::Identity& identity);

  /**
   * Removes the request outstanding with the given identity if, and only if, it is the given one.
   *
   * @param identity
   *        Identity.
   * @param state
   *        The request.
   * @return Whether it was removed.
   */
  bool take_request_if(const util::Identity& identity, const detail::Request_state_ptr& state);

  /**
   * Removes and returns all outstanding requests.
   * @return See above.
   */
  std::vector<detail::Request_state_ptr> take_all_requests();

  /**
   * Number of in-flight sends.
   * @return See above.
   */
  size_t send_count() const;

  /**
   * Number of messages holding a slot.
   * @return See above.
   */
  size_t release_count() const;

  /**
   * Number of outstanding requests.
   * @return See above.
   */
  size_t request_count() const;

private:
  // Types.

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for its lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Hash for util::Identity keys.
  struct Identity_hash
  {
    /**
     * Hashes.
     * @param val
     *        Identity.
     * @return See above.
     */
    size_t operator()(const util::Identity& val) const;
  };

  // Data.

  /// Protects everything else.
  mutable Mutex m_mutex;

  /// Last continuation ID generated; 0 is never used.
  uint64_t m_last_continuation_id;

  /// Continuation ID => in-flight send.
  boost::unordered_map<uint64_t, Send_entry> m_sends;

  /// The Message objects in #m_sends (to catch sending one object twice concurrently).
  boost::unordered_set<const Message*> m_sending;

  /// Key => received message holding a slot.
  boost::unordered_map<Release_key, Release_entry> m_releases;

  /// Identity => outstanding request.
  boost::unordered_map<util::Identity, detail::Request_state_ptr, Identity_hash> m_requests;
}; // class Pending_table

} // namespace chirp::session

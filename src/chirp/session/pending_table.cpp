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
#include "chirp/session/pending_table.hpp"
#include <boost/functional/hash/hash.hpp>

namespace chirp::session
{

// Implementations.

Pending_table::Pending_table() :
  m_last_continuation_id(0)
{
  // That's it.
}

uint64_t Pending_table::register_send(Send_entry&& entry)
{
  Lock_guard lock(m_mutex);

  if (!m_sending.insert(entry.m_msg.get()).second)
  {
    return 0;
  }
  // else

  const auto id = ++m_last_continuation_id;
  m_sends.emplace(id, std::move(entry));
  return id;
}

std::optional<Pending_table::Send_entry> Pending_table::take_send(uint64_t continuation_id)
{
  Lock_guard lock(m_mutex);

  const auto it = m_sends.find(continuation_id);
  if (it == m_sends.end())
  {
    return std::nullopt;
  }
  // else

  std::optional<Send_entry> result(std::move(it->second));
  m_sends.erase(it);
  m_sending.erase(result->m_msg.get());
  return result;
}

std::vector<Pending_table::Send_entry> Pending_table::take_all_sends()
{
  std::vector<Send_entry> result;

  Lock_guard lock(m_mutex);
  result.reserve(m_sends.size());
  for (auto& id_and_entry : m_sends)
  {
    result.emplace_back(std::move(id_and_entry.second));
  }
  m_sends.clear();
  m_sending.clear();
  return result;
}

bool Pending_table::register_release(const Release_key& key, Release_entry&& entry)
{
  Lock_guard lock(m_mutex);
  return m_releases.emplace(key, std::move(entry)).second;
}

Release_future Pending_table::release_future(const Release_key& key) const
{
  Lock_guard lock(m_mutex);

  const auto it = m_releases.find(key);
  return (it == m_releases.end()) ? Release_future() : it->second.m_future;
}

std::optional<Pending_table::Release_entry> Pending_table::take_release(const Release_key& key)
{
  Lock_guard lock(m_mutex);

  const auto it = m_releases.find(key);
  if (it == m_releases.end())
  {
    return std::nullopt;
  }
  // else

  std::optional<Release_entry> result(std::move(it->second));
  m_releases.erase(it);
  return result;
}

std::vector<Pending_table::Release_entry> Pending_table::release_entries() const
{
  std::vector<Release_entry> result;

  Lock_guard lock(m_mutex);
  result.reserve(m_releases.size());
  for (const auto& key_and_entry : m_releases)
  {
    result.push_back(key_and_entry.second);
  }
  return result;
}

std::vector<Pending_table::Release_entry> Pending_table::take_all_releases()
{
  std::vector<Release_entry> result;

  Lock_guard lock(m_mutex);
  result.reserve(m_releases.size());
  for (auto& key_and_entry : m_releases)
  {
    result.emplace_back(std::move(key_and_entry.second));
  }
  m_releases.clear();
  return result;
}

bool Pending_table::register_request(const util::Identity& identity, const detail::Request_state_ptr& state)
{
  Lock_guard lock(m_mutex);
  return m_requests.emplace(identity, state).second;
}

detail::Request_state_ptr Pending_table::take_request(const util::Identity& identity)
{
  Lock_guard lock(m_mutex);

  const auto it = m_requests.find(identity);
  if (it == m_requests.end())
  {
    return detail::Request_state_ptr();
  }
  // else

  auto state = std::move(it->second);
  m_requests.erase(it);
  return state;
}

bool Pending_table::take_request_if(const util::Identity& identity, const detail::Request_state_ptr& state)
{
  Lock_guard lock(m_mutex);

  const auto it = m_requests.find(identity);
  if ((it == m_requests.end()) || (it->second != state))
  {
    return false;
  }
  // else
  m_requests.erase(it);
  return true;
}

std::vector<detail::Request_state_ptr> Pending_table::take_all_requests()
{
  std::vector<detail::Request_state_ptr> result;

  Lock_guard lock(m_mutex);
  result.reserve(m_requests.size());
  for (auto& id_and_state : m_requests)
  {
    result.emplace_back(std::move(id_and_state.second));
  }
  m_requests.clear();
  return result;
}

size_t Pending_table::send_count() const
{
  Lock_guard lock(m_mutex);
  return m_sends.size();
}

size_t Pending_table::release_count() const
{
  Lock_guard lock(m_mutex);
  return m_releases.size();
}

size_t Pending_table::request_count() const
{
  Lock_guard lock(m_mutex);
  return m_requests.size();
}

size_t Pending_table::Identity_hash::operator()(const util::Identity& val) const
{
  return boost::hash_range(val.begin(), val.end());
}

} // namespace chirp::session

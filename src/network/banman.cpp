// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/banman.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chaincraft {
namespace network {

BanMan::BanMan(const std::string &datadir, bool auto_save)
    : m_datadir(datadir), m_auto_save(auto_save) {
  LOG_NET_TRACE("BanMan initialized (datadir: {}, auto_save: {})",
                datadir.empty() ? "<none>" : datadir, auto_save);
}

BanMan::~BanMan() {
  if (!m_datadir.empty()) {
    Save();
  }
}

std::string BanMan::GetBanlistPath() const {
  if (m_datadir.empty()) {
    return "";
  }
  return (std::filesystem::path(m_datadir) / "banlist.json").string();
}

bool BanMan::Load() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);

  std::string path = GetBanlistPath();
  if (path.empty()) {
    return true;
  }

  auto contents = util::read_file_string(path);
  if (!contents) {
    LOG_NET_TRACE("BanMan: no existing banlist found at {}", path);
    return true; // first run
  }

  json j = json::parse(*contents, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    LOG_NET_ERROR("BanMan: failed to parse {}", path);
    return false;
  }

  int version = j.value("version", 0);
  if (version != BANLIST_VERSION) {
    LOG_NET_ERROR("BanMan: unsupported banlist version {} in {}", version, path);
    return false;
  }

  auto bans = j.find("bans");
  if (bans == j.end() || !bans->is_object()) {
    LOG_NET_ERROR("BanMan: {} has no bans object", path);
    return false;
  }

  int64_t now = util::GetTime();
  size_t loaded = 0;
  size_t expired = 0;

  for (const auto &[address, ban_data] : bans->items()) {
    if (!ban_data.is_object()) {
      LOG_NET_WARN("BanMan: skipping malformed entry for {}", address);
      continue;
    }
    BanEntry entry(ban_data.value("create_time", int64_t(0)),
                   ban_data.value("ban_until", int64_t(0)),
                   ban_data.value("reason", std::string()));
    if (entry.IsExpired(now)) {
      ++expired;
      continue;
    }
    m_banned[address] = std::move(entry);
    ++loaded;
  }

  LOG_NET_INFO("BanMan: loaded {} bans from {} (skipped {} expired)", loaded,
               path, expired);

  if (expired > 0 && m_auto_save) {
    SaveInternal();
  }
  return true;
}

size_t BanMan::SweepBannedInternal(int64_t now) {
  size_t removed = 0;
  for (auto it = m_banned.begin(); it != m_banned.end();) {
    if (it->second.IsExpired(now)) {
      LOG_NET_TRACE("BanMan: sweeping expired ban for {}", it->first);
      it = m_banned.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

bool BanMan::SaveInternal() {
  std::string path = GetBanlistPath();
  if (path.empty()) {
    return true;
  }

  SweepBannedInternal(util::GetTime());

  json bans = json::object();
  for (const auto &[address, entry] : m_banned) {
    bans[address] = {{"create_time", entry.create_time},
                     {"ban_until", entry.ban_until},
                     {"reason", entry.reason}};
  }
  json j = {{"version", BANLIST_VERSION}, {"bans", std::move(bans)}};

  if (!util::atomic_write_file(path, j.dump(2))) {
    LOG_NET_ERROR("BanMan: failed to save {}", path);
    return false;
  }
  LOG_NET_TRACE("BanMan: saved {} bans to {}", m_banned.size(), path);
  return true;
}

bool BanMan::Save() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  return SaveInternal();
}

void BanMan::Ban(const std::string &address, int64_t ban_time_offset,
                 const std::string &reason) {
  std::lock_guard<std::mutex> lock(m_banned_mutex);

  int64_t now = util::GetTime();
  int64_t ban_until = ban_time_offset > 0 ? now + ban_time_offset : 0;
  m_banned[address] = BanEntry(now, ban_until, reason);

  if (ban_time_offset > 0) {
    LOG_NET_WARN("BanMan: banned {} until {} ({}s){}{}", address, ban_until,
                 ban_time_offset, reason.empty() ? "" : ": ", reason);
  } else {
    LOG_NET_WARN("BanMan: permanently banned {}{}{}", address,
                 reason.empty() ? "" : ": ", reason);
  }
  if (m_auto_save) {
    SaveInternal();
  }
}

void BanMan::Unban(const std::string &address) {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  if (m_banned.erase(address) == 0) {
    LOG_NET_TRACE("BanMan: address {} was not banned", address);
    return;
  }
  LOG_NET_INFO("BanMan: unbanned {}", address);
  if (m_auto_save) {
    SaveInternal();
  }
}

bool BanMan::IsBanned(const std::string &address) const {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  auto it = m_banned.find(address);
  if (it == m_banned.end()) {
    return false;
  }
  return !it->second.IsExpired(util::GetTime());
}

void BanMan::Discourage(const std::string &address) {
  std::lock_guard<std::mutex> lock(m_discouraged_mutex);

  int64_t now = util::GetTime();
  int64_t expiry = now + DISCOURAGEMENT_DURATION;
  m_discouraged[address] = expiry;
  LOG_NET_INFO("BanMan: discouraged {} until {}", address, expiry);

  // Bounded under attack: drop expired first, then the earliest expiry
  if (m_discouraged.size() > MAX_DISCOURAGED) {
    for (auto it = m_discouraged.begin(); it != m_discouraged.end();) {
      if (now >= it->second) {
        it = m_discouraged.erase(it);
      } else {
        ++it;
      }
    }
    if (m_discouraged.size() > MAX_DISCOURAGED) {
      auto victim = m_discouraged.end();
      int64_t min_expiry = std::numeric_limits<int64_t>::max();
      for (auto it = m_discouraged.begin(); it != m_discouraged.end(); ++it) {
        if (it->second < min_expiry) {
          min_expiry = it->second;
          victim = it;
        }
      }
      if (victim != m_discouraged.end()) {
        m_discouraged.erase(victim);
      }
    }
  }
}

bool BanMan::IsDiscouraged(const std::string &address) const {
  std::lock_guard<std::mutex> lock(m_discouraged_mutex);
  auto it = m_discouraged.find(address);
  if (it == m_discouraged.end()) {
    return false;
  }
  // Expired entries are removed by SweepDiscouraged()
  return util::GetTime() < it->second;
}

void BanMan::ClearDiscouraged() {
  std::lock_guard<std::mutex> lock(m_discouraged_mutex);
  m_discouraged.clear();
}

void BanMan::SweepDiscouraged() {
  std::lock_guard<std::mutex> lock(m_discouraged_mutex);
  const int64_t now = util::GetTime();
  for (auto it = m_discouraged.begin(); it != m_discouraged.end();) {
    if (now >= it->second) {
      it = m_discouraged.erase(it);
    } else {
      ++it;
    }
  }
}

std::map<std::string, BanEntry> BanMan::GetBanned() const {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  return m_banned;
}

void BanMan::ClearBanned() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  m_banned.clear();
  if (m_auto_save) {
    SaveInternal();
  }
}

void BanMan::SweepBanned() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  size_t removed = SweepBannedInternal(util::GetTime());
  if (removed > 0) {
    LOG_NET_TRACE("BanMan: swept {} expired bans", removed);
    if (m_auto_save) {
      SaveInternal();
    }
  }
}

} // namespace network
} // namespace chaincraft

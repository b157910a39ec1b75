// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_BANMAN_HPP
#define CHAINCRAFT_BANMAN_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace chaincraft {
namespace network {

// A single ban (stored persistently on disk)
struct BanEntry {
  int64_t create_time{0}; // Unix timestamp when ban was created
  int64_t ban_until{0};   // Unix timestamp when ban expires (0 = permanent)
  std::string reason;

  BanEntry() = default;
  BanEntry(int64_t created, int64_t until, std::string why = {})
      : create_time(created), ban_until(until), reason(std::move(why)) {}

  bool IsExpired(int64_t now) const { return ban_until > 0 && now >= ban_until; }
};

// BanMan - bans and discouragement, keyed by address string.
//
// Two tiers:
// 1. Bans: "host" or "host:port", permanent or timed, persisted to
//    <datadir>/banlist.json. Used for repeated connection failures and
//    operator action.
// 2. Discouragement: in-memory, 24h, keyed by host. Set when a peer's
//    misbehavior score crosses the threshold.
class BanMan {
public:
  static constexpr int BANLIST_VERSION = 1;
  static constexpr int64_t DISCOURAGEMENT_DURATION = 24 * 60 * 60;
  static constexpr size_t MAX_DISCOURAGED = 10000;

  // Empty datadir keeps everything in memory
  explicit BanMan(const std::string &datadir = "", bool auto_save = true);
  ~BanMan();

  BanMan(const BanMan &) = delete;
  BanMan &operator=(const BanMan &) = delete;

  bool Load();
  bool Save();

  // 0 = permanent, otherwise seconds until expiry
  void Ban(const std::string &address, int64_t ban_time_offset = 0,
           const std::string &reason = "");
  void Unban(const std::string &address);
  bool IsBanned(const std::string &address) const;

  void Discourage(const std::string &address);
  bool IsDiscouraged(const std::string &address) const;
  void ClearDiscouraged();
  void SweepDiscouraged();

  std::map<std::string, BanEntry> GetBanned() const;
  void ClearBanned();
  void SweepBanned();

  std::string GetBanlistPath() const;

private:
  bool SaveInternal(); // m_banned_mutex must be held
  size_t SweepBannedInternal(int64_t now);

  std::string m_datadir;
  // Disabled by tests that want to control when the file is written
  bool m_auto_save;

  mutable std::mutex m_banned_mutex;
  std::map<std::string, BanEntry> m_banned;

  mutable std::mutex m_discouraged_mutex;
  std::map<std::string, int64_t> m_discouraged; // address -> expiry time
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_BANMAN_HPP

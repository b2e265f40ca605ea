#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "campaign/ICampaignStateStore.h"

namespace exitforge {
namespace campaign {

// One JSON object per line: {"seq", "ts_ms", "type": "strategy"|"run", "payload"}
class CampaignStateStoreJsonl : public ICampaignStateStore {
public:
    explicit CampaignStateStoreJsonl(std::filesystem::path file_path);

    bool appendStrategy(const strategy::StrategyConfig& config) override;
    bool appendRun(RunRecord& record) override;
    CampaignJournal load() override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    bool appendLine(const std::string& type, const nlohmann::json& payload, std::uint64_t& seq_out);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace campaign
} // namespace exitforge

#include "campaign/CampaignStateStoreJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <fstream>

namespace exitforge {
namespace campaign {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json runToJson(const RunRecord& r) {
    nlohmann::json j;
    j["run_id"] = r.run_id;
    j["strategy_id"] = r.strategy_id;
    j["kind"] = toString(r.kind);
    j["ts_ms"] = r.ts_ms;
    j["metrics"] = toJson(r.metrics);
    j["artifacts"] = r.artifacts;
    return j;
}

RunRecord runFromJson(const nlohmann::json& j, std::uint64_t seq) {
    RunRecord r;
    r.seq = seq;
    r.run_id = j.value("run_id", std::string());
    r.strategy_id = j.value("strategy_id", std::string());
    r.kind = runKindFromString(j.value("kind", std::string("full")));
    r.ts_ms = j.value("ts_ms", 0LL);
    r.metrics = runMetricsFromJson(j.value("metrics", nlohmann::json::object()));
    r.artifacts = j.value("artifacts", std::vector<std::string>());
    return r;
}
}

CampaignStateStoreJsonl::CampaignStateStoreJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed campaign journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool CampaignStateStoreJsonl::appendLine(const std::string& type,
                                         const nlohmann::json& payload,
                                         std::uint64_t& seq_out) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Cannot open campaign journal {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = nowMs();
    line["type"] = type;
    line["payload"] = payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Write to campaign journal {} failed", file_path_.string());
        return false;
    }

    last_seq_ = next_seq;
    seq_out = next_seq;
    return true;
}

bool CampaignStateStoreJsonl::appendStrategy(const strategy::StrategyConfig& config) {
    std::uint64_t seq = 0;
    return appendLine("strategy", strategy::toJson(config), seq);
}

bool CampaignStateStoreJsonl::appendRun(RunRecord& record) {
    std::uint64_t seq = 0;
    if (!appendLine("run", runToJson(record), seq)) {
        return false;
    }
    record.seq = seq;
    return true;
}

CampaignJournal CampaignStateStoreJsonl::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    CampaignJournal journal;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return journal;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            const std::string type = line.value("type", std::string());
            const nlohmann::json payload = line.value("payload", nlohmann::json::object());

            if (type == "strategy") {
                journal.strategies.push_back(strategy::strategyConfigFromJson(payload));
            } else if (type == "run") {
                journal.runs.push_back(runFromJson(payload, parseSeq(line)));
            } else {
                LOG_WARN("Unknown campaign journal entry type '{}' in {}", type, file_path_.string());
            }
        } catch (const std::exception& e) {
            LOG_WARN("Skipping campaign journal line in {}: {}", file_path_.string(), e.what());
        }
    }

    return journal;
}

std::uint64_t CampaignStateStoreJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace campaign
} // namespace exitforge

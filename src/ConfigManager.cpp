#include "ConfigManager.h"
#include "ReportSchema.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

// markers every compare harness prints on its way out
std::vector<std::string> commonKeywords()
{
    return {
        "缺少对比输入参数",
        "未找到可解码音频流",
        "ffmpeg 解码失败",
        "打开输入失败",
        std::string(schema::kTimeoutMarker),
        std::string(schema::kSpawnFailedMarker),
        std::string(schema::kCrashMarker),
    };
}

CoverageProfile aacProfile()
{
    CoverageProfile p;
    p.name = "aac";
    p.reportPath = "plans/tao-codec/audio/aac/coverage/report.md";
    p.inputEnvVar = "TAO_AAC_COMPARE_INPUT";
    p.arguments = { "test", "--test", "run_decoder", "aac::", "--", "--nocapture", "--ignored" };
    p.timeoutSec = 60;
    p.failureKeywords = commonKeywords();
    p.failureKeywords.insert(p.failureKeywords.begin(), "AAC 对比");
    p.failureKeywords.emplace_back("解析失败");
    return p;
}

CoverageProfile vorbisProfile()
{
    CoverageProfile p;
    p.name = "vorbis";
    p.reportPath = "plans/tao-codec/audio/vorbis/coverage/report.md";
    p.inputEnvVar = "TAO_VORBIS_COMPARE_INPUT";
    p.arguments = { "test", "--test", "run_decoder", "vorbis::", "--", "--nocapture", "--ignored" };
    p.timeoutSec = 180;
    p.failureKeywords = commonKeywords();
    p.failureKeywords.insert(p.failureKeywords.begin(), "Vorbis 对比失败");

    std::string const mgs = "暂时跳过: MetalGearSolid 异常 Ogg 样本, 后续专项处理";
    p.hardSkips = {
        { 36, {}, "上游已知问题: FFmpeg trac ticket8741 (dx50_vorbis.ogm), 当前阶段跳过" },
        { 45, {}, mgs },
        { 46, {}, mgs },
        { 47, {}, mgs },
    };
    return p;
}

CoverageProfile mp3Profile()
{
    CoverageProfile p;
    p.name = "mp3";
    p.reportPath = "plans/tao-codec_mp3_coverage/tao-codec_mp3_samples_report.md";
    p.inputEnvVar = "TAO_MP3_COMPARE_INPUT";
    p.arguments = { "test", "--test", "mp3_module_compare", "--", "--nocapture", "--ignored" };
    p.timeoutSec = 180;
    p.failureKeywords = commonKeywords();
    p.failureKeywords.insert(p.failureKeywords.begin(), "MP3 对比");
    return p;
}

} // namespace

namespace cfg {
std::vector<std::string> builtinProfileNames() { return { "aac", "vorbis", "mp3" }; }

std::optional<CoverageProfile> builtinProfile(std::string const& name)
{
    if (name == "aac")
        return aacProfile();
    if (name == "vorbis")
        return vorbisProfile();
    if (name == "mp3")
        return mp3Profile();
    return std::nullopt;
}

CoverageProfile loadProfile(std::filesystem::path const& file)
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
        throw ConfigError("cannot open profile [" + file.string() + "]");

    try {
        nlohmann::json j;
        in >> j;
        auto p = j.get<CoverageProfile>();
        spdlog::debug("[cfg] loaded profile '{}' from {}", p.name, file.string());
        return p;
    } catch (nlohmann::json::exception const& e) {
        spdlog::error("[cfg] failed to read {}: {}", file.string(), e.what());
        throw ConfigError("invalid profile [" + file.string() + "]: " + e.what());
    }
}

void saveProfile(std::filesystem::path const& file, CoverageProfile const& p)
{
    nlohmann::json j = p;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out)
        throw ConfigError("cannot write profile [" + file.string() + "]");
    out << j.dump(4) << '\n';
    if (!out)
        throw ConfigError("short write to profile [" + file.string() + "]");
}
} // namespace cfg

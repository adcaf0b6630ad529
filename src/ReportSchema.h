#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

// Vocabulary of the coverage report table. Existing reports use these exact
// strings, so they are part of the file format.
namespace schema {

inline constexpr std::string_view kHeaderPrefix = "| 序号 |";
inline constexpr std::string_view kSeparatorPrefix = "| --- |";

enum class Column {
    Index,
    Url,
    Status,
    Reason,
    DecoderCount,
    ReferenceCount,
    CountDelta,
    MaxErr,
    Psnr,
    Precision,
    Remark
};

inline constexpr std::size_t kColumnCount = 11;

inline constexpr std::array<std::string_view, kColumnCount> kColumnNames = {
    "序号", "URL", "状态", "失败原因", "Tao样本数", "FFmpeg样本数",
    "样本数差异", "max_err", "psnr(dB)", "精度(%)", "备注"
};

inline constexpr std::string_view columnName(Column c)
{
    return kColumnNames[static_cast<std::size_t>(c)];
}

enum class RowStatus { Pending,
    Success,
    Failure,
    Skipped };

inline constexpr std::string_view kStatusSuccess = "成功";
inline constexpr std::string_view kStatusFailure = "失败";
inline constexpr std::string_view kStatusSkipped = "跳过";

inline std::string_view toString(RowStatus s)
{
    switch (s) {
    case RowStatus::Success:
        return kStatusSuccess;
    case RowStatus::Failure:
        return kStatusFailure;
    case RowStatus::Skipped:
        return kStatusSkipped;
    case RowStatus::Pending:
        break;
    }
    return {};
}

// anything else (empty or hand-edited) counts as never tested
inline RowStatus statusFromString(std::string_view s)
{
    if (s == kStatusSuccess)
        return RowStatus::Success;
    if (s == kStatusFailure)
        return RowStatus::Failure;
    if (s == kStatusSkipped)
        return RowStatus::Skipped;
    return RowStatus::Pending;
}

// remark / reason markers
inline constexpr std::string_view kRemarkSkipped = "已跳过";
inline constexpr std::string_view kRemarkStrictFailed = "严格阈值未通过";
inline constexpr std::string_view kDefaultSkipReason = "按规则跳过";
inline constexpr std::string_view kNoOutput = "无输出";
inline constexpr std::string_view kTimeoutMarker = "单样本测试超时";
inline constexpr std::string_view kSpawnFailedMarker = "启动对比命令失败";
inline constexpr std::string_view kCrashMarker = "对比进程异常退出";

} // namespace schema

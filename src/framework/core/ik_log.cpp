#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <string_view>

#include "core/ik_log.h"

namespace ipkit::log {

static std::atomic<ik_log_level> log_level{IK_LOG_INFO};

static constexpr std::array<std::string_view, IK_LOG_MAX> level_names = {
    "none", "critical", "error", "warning", "info", "debug", "trace"};

/* Longest accepted level argument, "critical" */
static constexpr size_t max_level_length = 8;

static constexpr std::string_view operator_keyword = "operator";

static bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    return (lhs.size() == rhs.size()
            && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](auto a, auto b) {
                   return (std::tolower(static_cast<unsigned char>(a))
                           == std::tolower(static_cast<unsigned char>(b)));
               }));
}

static bool is_identifier_char(char c)
{
    return (std::isalnum(static_cast<unsigned char>(c)) || c == '_');
}

/* True if the operator keyword starts at idx as a whole word */
static bool is_operator_keyword(std::string_view sig, size_t idx)
{
    if (sig.compare(idx, operator_keyword.size(), operator_keyword) != 0) {
        return (false);
    }
    auto next = idx + operator_keyword.size();
    return ((idx == 0 || !is_identifier_char(sig[idx - 1]))
            && (next == sig.size() || !is_identifier_char(sig[next])));
}

/*
 * Position of the argument list following an operator name that ends at
 * or after idx; the call operator's own "()" belongs to the name.
 */
static size_t operator_arguments(std::string_view sig, size_t idx)
{
    if (sig.compare(idx, 2, "()") == 0) { idx += 2; }
    auto paren = sig.find('(', idx);
    return (paren == std::string_view::npos ? sig.size() : paren);
}

static std::string_view format_timestamp(char* buffer, size_t length)
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto usecs =
        duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

    struct tm tm;
    gmtime_r(&secs, &tm);

    auto cursor = strftime(buffer, length, "%Y-%m-%dT%H:%M:%S", &tm);
    cursor += snprintf(buffer + cursor, length - cursor, ".%06ldZ",
                       static_cast<long>(usecs));
    return (std::string_view(buffer, cursor));
}

static int vlog(enum ik_log_level level,
                const char* tag,
                const char* format,
                va_list argp)
{
    std::array<char, 1024> message;
    auto length = vsnprintf(message.data(), message.size(), format, argp);
    if (length < 0) { return (-1); }

    std::array<char, 40> timestamp;
    auto ts = format_timestamp(timestamp.data(), timestamp.size());

    /* Terminate the line unless the caller already did. */
    auto last = std::min(static_cast<size_t>(length), message.size() - 1);
    auto newline = (last > 0 && message[last - 1] == '\n') ? "" : "\n";

    auto written = fprintf(stderr,
                           "%.*s  %-8s %s: %s%s",
                           static_cast<int>(ts.size()),
                           ts.data(),
                           ik_log_level_name(level),
                           tag ? tag : "",
                           message.data(),
                           newline);
    return (written < 0 ? -1 : 0);
}

} // namespace ipkit::log

using namespace ipkit::log;

enum ik_log_level ik_log_level_get(void)
{
    return (log_level.load(std::memory_order_relaxed));
}

void ik_log_level_set(enum ik_log_level level)
{
    log_level.store(level, std::memory_order_relaxed);
}

const char* ik_log_level_name(enum ik_log_level level)
{
    if (level < IK_LOG_NONE || level >= IK_LOG_MAX) { return ("unknown"); }
    return (level_names[level].data());
}

enum ik_log_level parse_log_optarg(const char* arg)
{
    if (arg == nullptr) { return (IK_LOG_NONE); }

    auto value = std::string_view(arg);
    if (value.empty() || value.size() > max_level_length) {
        return (IK_LOG_NONE);
    }

    if (std::all_of(value.begin(), value.end(), [](auto c) {
            return (std::isdigit(static_cast<unsigned char>(c)));
        })) {
        auto level = std::strtol(arg, nullptr, 10);
        return (level > IK_LOG_NONE && level < IK_LOG_MAX
                    ? static_cast<enum ik_log_level>(level)
                    : IK_LOG_NONE);
    }

    for (size_t idx = IK_LOG_CRITICAL; idx < level_names.size(); idx++) {
        if (equals_ignore_case(value, level_names[idx])) {
            return (static_cast<enum ik_log_level>(idx));
        }
    }

    return (IK_LOG_NONE);
}

void ik_log_function_name(const char* signature, char* function)
{
    /*
     * The name runs from the last space at template depth 0 up to the
     * argument list. Operator names contain '<', '>' and '(' of their own,
     * so the keyword jumps straight to the argument list.
     */
    auto sig = std::string_view(signature);
    int depth = 0;
    size_t start = 0;
    size_t end = sig.size();
    for (size_t idx = 0; idx < sig.size(); idx++) {
        auto c = sig[idx];
        if (depth == 0 && is_operator_keyword(sig, idx)) {
            end = operator_arguments(sig, idx + operator_keyword.size());
            break;
        } else if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth = std::max(depth - 1, 0);
        } else if (depth == 0 && c == ' ') {
            start = idx + 1;
        } else if (depth == 0 && c == '(') {
            end = idx;
            break;
        }
    }

    if (start > end) { start = 0; }

    auto name = sig.substr(start, end - start);
    std::copy(name.begin(), name.end(), function);
    function[name.size()] = '\0';
}

int ik_log(enum ik_log_level level, const char* tag, const char* format, ...)
{
    va_list argp;
    va_start(argp, format);
    auto error = vlog(level, tag, format, argp);
    va_end(argp);
    return (error);
}

int ik_log_signed(enum ik_log_level level,
                  const char* signature,
                  const char* format,
                  ...)
{
    auto tag = std::string(signature);
    ik_log_function_name(signature, tag.data());

    va_list argp;
    va_start(argp, format);
    auto error = vlog(level, tag.c_str(), format, argp);
    va_end(argp);
    return (error);
}

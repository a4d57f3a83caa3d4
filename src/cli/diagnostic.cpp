#include "cli/diagnostic.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace errlens::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return isatty(fileno(stderr)) != 0;
#else
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

// ============================================================================
// ClassificationEmitter
// ============================================================================

ClassificationEmitter::ClassificationEmitter(std::ostream& out) : out_(out) {}

void ClassificationEmitter::emit(const classify::ClassifiedError& classified) {
    emitted_count_++;

    if (json_) {
        emit_json(classified);
    } else {
        emit_text(classified);
    }
}

void ClassificationEmitter::emit_text(const classify::ClassifiedError& classified) {
    // error[Kind]: message
    out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error["
         << classify::kind_name(classified.kind.id()) << "]" << color(Colors::Reset)
         << color(Colors::Bold) << ": " << strip_ansi(classified.message) << color(Colors::Reset)
         << "\n";

    out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset)
         << ": was: " << classified.overridden_message << "\n";

    if (classified.suggested_fix) {
        const auto& fix = *classified.suggested_fix;
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": try `";
        if (fix.parameter()) {
            out_ << *fix.parameter() << " ";
        }
        out_ << fix.suggestion() << "`\n";
    }
}

void ClassificationEmitter::emit_json(const classify::ClassifiedError& classified) {
    out_ << "{";
    out_ << "\"kind\":\"" << classify::kind_name(classified.kind.id()) << "\",";
    out_ << "\"label\":\"" << escape_json_string(classified.kind.label()) << "\",";
    out_ << "\"message\":\"" << escape_json_string(strip_ansi(classified.message)) << "\",";
    out_ << "\"overridden_message\":\"" << escape_json_string(classified.overridden_message)
         << "\"";

    if (classified.suggested_fix) {
        const auto& fix = *classified.suggested_fix;
        out_ << ",\"suggestion\":{";
        out_ << "\"value\":\"" << escape_json_string(fix.suggestion()) << "\",";
        out_ << "\"kind\":\"" << classify::correction_kind_name(fix.kind()) << "\",";
        out_ << "\"parameter\":";
        if (fix.parameter()) {
            out_ << "\"" << escape_json_string(*fix.parameter()) << "\"";
        } else {
            out_ << "null";
        }
        out_ << "}";
    }

    out_ << "}\n";
}

std::string ClassificationEmitter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

std::string ClassificationEmitter::strip_ansi(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
            // CSI sequence: ESC [ params final-byte
            size_t j = i + 2;
            while (j < s.size() && !(s[j] >= '@' && s[j] <= '~')) {
                ++j;
            }
            i = j;
            continue;
        }
        result += s[i];
    }
    return result;
}

} // namespace errlens::cli

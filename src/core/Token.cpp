#include "Token.hpp"

#include "../debug/log.hpp"

#include <cctype>
#include <string_view>

#include <re2/re2.h>
#include <fmt/format.h>

constexpr const char* MODHEX_ALPHABET = "cbdefghijklnrtuv";
constexpr const char* DVORAK_ALPHABET = "jxe.uidchtnbpygk";

constexpr const size_t PREFIX_MAX_LEN = 16;
constexpr const size_t CIPHERTEXT_LEN = 32;

static std::string patternFor(const std::string& delim, bool dvorak) {
    // '.' is literal inside a class
    const std::string CLASS = fmt::format("[{}]", dvorak ? DVORAK_ALPHABET : MODHEX_ALPHABET);
    return fmt::format("((.*){})?(({}{{0,{}}})({}{{{}}}))", delim, CLASS, PREFIX_MAX_LEN, CLASS, CIPHERTEXT_LEN);
}

static std::string dvorakToModhex(const std::string& in) {
    const std::string_view FROM = DVORAK_ALPHABET;
    std::string            out  = in;
    for (auto& c : out) {
        const bool UPPER = std::isupper((unsigned char)c);
        const auto POS   = FROM.find((char)std::tolower((unsigned char)c));
        if (POS == std::string_view::npos)
            continue;

        // keep the case the token typed, like the standard alphabet path does
        c = UPPER ? (char)std::toupper((unsigned char)MODHEX_ALPHABET[POS]) : MODHEX_ALPHABET[POS];
    }
    return out;
}

COTPToken::COTPToken(const std::string& raw, const std::string& delim) {
    if (parse(raw, delim, false)) {
        m_otp   = m_prefix + m_ciphertext;
        m_valid = true;
        return;
    }

    if (parse(raw, delim, true)) {
        m_otp   = dvorakToModhex(m_prefix + m_ciphertext);
        m_valid = true;
        return;
    }

    Debug::log(TRACE, "COTPToken: input of length {} is not an otp", raw.size());
}

bool COTPToken::parse(const std::string& raw, const std::string& delim, bool dvorak) {
    RE2::Options opts;
    opts.set_case_sensitive(false);
    opts.set_log_errors(false);

    const RE2 RE(patternFor(delim, dvorak), opts);
    if (!RE.ok()) {
        Debug::log(ERR, "COTPToken: delimiter \"{}\" does not form a valid pattern: {}", delim, RE.error());
        return false;
    }

    std::string passwordGroup, otp;
    if (!RE2::FullMatch(raw, RE, &passwordGroup, &m_password, &otp, &m_prefix, &m_ciphertext))
        return false;

    m_hasPassword = !passwordGroup.empty();
    return true;
}

std::string COTPToken::password() const {
    return m_password;
}

bool COTPToken::hasPassword() const {
    return m_hasPassword;
}

std::string COTPToken::prefix() const {
    return m_prefix;
}

std::string COTPToken::ciphertext() const {
    return m_ciphertext;
}

std::string COTPToken::otp() const {
    return m_otp;
}

bool COTPToken::valid() const {
    return m_valid;
}

#pragma once

#include <string>

// A token as typed by the user: [password<delim>]<prefix><ciphertext>, modhex encoded.
// Input typed on a Dvorak layout is accepted too and normalized to modhex.
class COTPToken {
  public:
    COTPToken(const std::string& raw, const std::string& delim = DEFAULT_DELIMITER);

    std::string password() const;
    bool        hasPassword() const;
    std::string prefix() const;
    std::string ciphertext() const;
    std::string otp() const;
    bool        valid() const;

    inline static const std::string DEFAULT_DELIMITER = "[:]";

  private:
    bool        parse(const std::string& raw, const std::string& delim, bool dvorak);

    std::string m_password, m_prefix, m_ciphertext, m_otp;
    bool        m_hasPassword = false;
    bool        m_valid       = false;
};

#include <cstdlib>
#include <envdebug/redact/classifier.h>
#include <iostream>
#include <string>
#include <string_view>

static void expect_sensitive(std::string_view name, bool expected)
{
    if (envdebug::redact::is_sensitive(name) != expected)
    {
        std::cerr << "FAIL: is_sensitive('" << name << "'): expected "
                  << (expected ? "true" : "false") << "\n";
        std::exit(1);
    }
}

int main()
{
    // KEY as a word.
    for (const char* name : {"API_KEY", "api_key", "Api_Key", "KEY", "MY_SECRET_KEY", "KEYRING"})
    {
        expect_sensitive(name, true);
    }

    for (const char* name : {"ACCESS_TOKEN", "access_token", "TOKEN", "GITHUB_TOKEN"})
    {
        expect_sensitive(name, true);
    }

    // CRED has no right boundary, so longer words starting with it still match.
    for (const char* name : {"AWS_CREDENTIALS", "CREDENTIAL_PATH", "CRED", "credentials"})
    {
        expect_sensitive(name, true);
    }

    for (const char* name : {"PASSWORD", "DB_PASSWORD", "PASS", "DB_PASS", "PASS_FILE",
                             "PASSPHRASE", "password", "gpg_passphrase"})
    {
        expect_sensitive(name, true);
    }

    for (const char* name : {"SECRET", "AWS_SECRET_KEY", "SECRET_VALUE", "my_secret"})
    {
        expect_sensitive(name, true);
    }

    for (const char* name : {"AUTH", "AUTH_TOKEN", "BASIC_AUTH", "authorization"})
    {
        expect_sensitive(name, true);
    }

    // Tokens embedded in a longer word, or PASS followed by more letters.
    for (const char* name : {"HOME", "PATH", "USER", "SHELL", "HOSTNAME", "COMPASS", "MONKEY",
                             "PASSPORT_NUMBER", "SUBTOKEN_ID", "PASSAGE", "BYPASS", "OAUTH"})
    {
        expect_sensitive(name, false);
    }

    // Degenerate and unusual names.
    expect_sensitive("", false);
    expect_sensitive("_", false);
    expect_sensitive("__", false);
    expect_sensitive("_KEY", true);
    expect_sensitive("KEY_", true);
    expect_sensitive("X__PASS__Y", true);
    expect_sensitive("PASS_", true);
    expect_sensitive("\xc3\xa9_TOKEN", true);
    expect_sensitive("\xc3\xa9TOKEN", false);
    expect_sensitive(std::string("A\0KEY", 5), false);
    expect_sensitive(std::string("A_\nKEY", 6), false);
    expect_sensitive("K-E-Y", false);

    // Case folding applies to every segment, not only the first.
    expect_sensitive("Db_PaSs", true);
    expect_sensitive("x_sEcReT_y", true);

    // Repeated calls agree.
    for (int i = 0; i < 3; ++i)
    {
        expect_sensitive("DB_PASS", true);
        expect_sensitive("COMPASS", false);
    }

    std::cout << "OK\n";
    return 0;
}

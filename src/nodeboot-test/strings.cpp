#include <nodeboot-test/util.h>

#include <nodeboot/base/strings.h>

#include <string>
#include <vector>

using namespace nodeboot;

TEST_CASE ("split by char", "[strings]")
{
    using Strings::split;
    using result_t = std::vector<std::string>;
    REQUIRE(split(",,,,,,", ',').empty());
    REQUIRE(split(",,a,,b,,", ',') == result_t{"a", "b"});
    REQUIRE(split("/usr/bin:/bin", ':') == result_t{"/usr/bin", "/bin"});
    REQUIRE(split("no delimiters", ',') == result_t{"no delimiters"});
}

TEST_CASE ("split_paths", "[strings]")
{
    using result_t = std::vector<std::string>;
#if defined(_WIN32)
    CHECK(Strings::split_paths("C:\\Windows;;C:\\Program Files\\nodejs;") ==
          result_t{"C:\\Windows", "C:\\Program Files\\nodejs"});
#else
    CHECK(Strings::split_paths("/usr/local/bin::/usr/bin:") == result_t{"/usr/local/bin", "/usr/bin"});
#endif
    CHECK(Strings::split_paths("").empty());
}

TEST_CASE ("trim", "[strings]")
{
    CHECK(Strings::trim("  30 \t") == "30");
    CHECK(Strings::trim("") == "");
    CHECK(Strings::trim("   ") == "");
}

TEST_CASE ("case_insensitive_ascii_equals", "[strings]")
{
    CHECK(Strings::case_insensitive_ascii_equals("AMD64", "amd64"));
    CHECK(Strings::case_insensitive_ascii_equals("", ""));
    CHECK_FALSE(Strings::case_insensitive_ascii_equals("arm64", "arm"));
    CHECK(Strings::ascii_to_lowercase("Darwin") == "darwin");
}

TEST_CASE ("strto", "[strings]")
{
    CHECK(Strings::strto<long>("60") == Optional<long>(60));
    CHECK(Strings::strto<long>("-1") == Optional<long>(-1));
    CHECK_FALSE(Strings::strto<long>(" 60").has_value());
    CHECK_FALSE(Strings::strto<long>("60s").has_value());
    CHECK_FALSE(Strings::strto<long>("99999999999999999999999").has_value());
    CHECK(Strings::strto<int>("127") == Optional<int>(127));
}

TEST_CASE ("concat and join", "[strings]")
{
    CHECK(Strings::concat("tmp-", 1234L) == "tmp-1234");
    CHECK(Strings::concat('v', StringView("20.11.0"), std::string("/bin")) == "v20.11.0/bin");
    CHECK(Strings::join(", ", std::vector<std::string>{"a", "b", "c"}) == "a, b, c");
    CHECK(Strings::join(", ", std::vector<std::string>{}) == "");
}

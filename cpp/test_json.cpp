#include "lexport/json.hpp"
#include "test_util.hpp"

#include <stdexcept>
#include <string>

namespace json = lexport::json;
using lexport::test::Check;
using lexport::test::CheckThrows;

namespace {

void TestEncode() {
    lexport::test::Section("Encode:");
    Check(json::EncodeObject({}) == "{}", "empty object");
    json::Fields fields = {{"theme", "dark"}, {"quote", "say \"hi\"\n"}, {"tab\t", "\x01"}};
    Check(json::EncodeObject(fields) == "{\"theme\":\"dark\",\"quote\":\"say \\\"hi\\\"\\n\",\"tab\\t\":\"\\u0001\"}",
          "escapes quotes, newlines and control bytes");
}

void TestDecode() {
    lexport::test::Section("Decode:");
    auto fields = json::DecodeObject(" { \"a\" : \"1\" , \"b\":\"two\\/2\" } ");
    Check(fields.size() == 2, "two fields");
    Check(json::Find(fields, "a") && *json::Find(fields, "a") == "1", "first value");
    Check(json::Find(fields, "b") && *json::Find(fields, "b") == "two/2", "escaped solidus");
    Check(json::Find(fields, "c") == nullptr, "missing key");

    auto unicode = json::DecodeObject("{\"k\":\"caf\\u00e9 \\ud83d\\ude00\"}");
    Check(unicode.size() == 1 && unicode[0].second == "caf\xC3\xA9 \xF0\x9F\x98\x80", "unicode escapes become UTF-8");

    auto dup = json::DecodeObject("{\"x\":\"1\",\"y\":\"2\",\"x\":\"3\"}");
    Check(dup.size() == 2 && dup[0].first == "x" && dup[0].second == "3", "repeated key keeps last value");

    json::Fields original = {{"session", "abc=123; path=/"}, {"emoji", "\xF0\x9F\x98\x80"}, {"", "empty key"}};
    Check(json::DecodeObject(json::EncodeObject(original)) == original, "encode then decode");
}

void TestMalformed() {
    lexport::test::Section("Malformed input:");
    CheckThrows<std::runtime_error>([] { json::DecodeObject(""); }, "empty text");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("[]"); }, "array");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("{\"a\":1}"); }, "number value");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("{\"a\":\"1\""); }, "unterminated object");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("{\"a\":\"1\"} x"); }, "trailing text");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("{\"a\":\"\\q\"}"); }, "unknown escape");
    CheckThrows<std::runtime_error>([] { json::DecodeObject("{\"a\":\"\\ud83d\"}"); }, "lone surrogate");
    CheckThrows<std::runtime_error>([] { json::EncodeObject({{"k", "\xC3\x28"}}); }, "invalid UTF-8 value");
}

}  // namespace

int main() {
    TestEncode();
    TestDecode();
    TestMalformed();
    return lexport::test::Finish("json");
}

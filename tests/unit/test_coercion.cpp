#include <gtest/gtest.h>
#include "fdk/coercion.hpp"
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace fdk;

namespace {

struct Person {
    std::string name;
    int age = 0;
    std::vector<std::string> tags;
};

void to_json(nlohmann::json& j, const Person& p) {
    j = {{"name", p.name}, {"age", p.age}, {"tags", p.tags}};
}

void from_json(const nlohmann::json& j, Person& p) {
    j.at("name").get_to(p.name);
    j.at("age").get_to(p.age);
    j.at("tags").get_to(p.tags);
}

struct Greeting {
    std::string name;
};

void to_json(nlohmann::json& j, const Greeting& g) {
    j = {{"name", g.name}};
}

void from_json(const nlohmann::json& j, Greeting& g) {
    j.at("name").get_to(g.name);
}

struct Tally {
    int age = 0;
    unsigned count = 0;
};

void to_json(nlohmann::json& j, const Tally& t) {
    j = {{"age", t.age}, {"count", t.count}};
}

void from_json(const nlohmann::json& j, Tally& t) {
    j.at("age").get_to(t.age);
    j.at("count").get_to(t.count);
}

std::string coercion_message(const std::function<void()>& f) {
    try {
        f();
    } catch (const CoercionError& e) {
        return e.what();
    }
    return "no error";
}

// No default constructor: decoded without shape guidance
struct Reading {
    explicit Reading(double v) : value(v) {}
    double value;
};

void to_json(nlohmann::json& j, const Reading& r) {
    j = {{"value", r.value}};
}

struct Unconvertible {};

Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string str(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

Person ann() {
    Person p;
    p.name = "Ann";
    p.age = 30;
    p.tags = {"admin", "ops"};
    return p;
}

} // anonymous namespace

// ---- Capability traits ----

TEST(CoercionTraits, Capabilities) {
    static_assert(is_input_coercible_v<Person>);
    static_assert(is_output_coercible_v<Person>);
    static_assert(is_input_coercible_v<std::string>);
    static_assert(is_output_coercible_v<std::map<std::string, int>>);
    static_assert(is_output_coercible_v<Reading>);
    static_assert(!is_input_coercible_v<Unconvertible>);
    static_assert(!is_output_coercible_v<Unconvertible>);
    SUCCEED();
}

// ---- JSON ----

TEST(CoercionJson, DecodesRecord) {
    auto g = decode<Greeting>(ContentType::JSON, bytes(R"({"name":"Ann"})"));
    EXPECT_EQ(g.name, "Ann");
}

TEST(CoercionJson, ReencodesEquivalentJson) {
    auto g = decode<Greeting>(ContentType::JSON, bytes(R"({"name":"Ann"})"));
    auto out = encode_payload(ContentType::JSON, g);
    EXPECT_EQ(out.content_type, "application/json");
    EXPECT_EQ(nlohmann::json::parse(str(out.body)), nlohmann::json({{"name", "Ann"}}));
}

TEST(CoercionJson, InvalidJsonThrows) {
    try {
        (void)decode<Greeting>(ContentType::JSON, bytes("{not valid json"));
        FAIL() << "Expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_FALSE(std::string(e.what()).empty());
    }
}

TEST(CoercionJson, TypeMismatchThrows) {
    EXPECT_THROW((void)decode<Person>(ContentType::JSON, bytes(R"({"name":"Ann","age":"old","tags":[]})")),
                 CoercionError);
    EXPECT_THROW((void)decode<Greeting>(ContentType::JSON, bytes("{}")), CoercionError);
}

TEST(CoercionJson, MessageIsPassedThrough) {
    try {
        (void)decode<int>(ContentType::JSON, bytes(R"("seven")"));
        FAIL() << "Expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_NE(std::string(e.what()).find("type must be number"), std::string::npos);
    }
}

TEST(CoercionJson, NumbersAreNotGuessed) {
    // JSON is typed: a quoted number stays a string
    EXPECT_THROW(((void)decode<std::map<std::string, int>>(ContentType::JSON, bytes(R"({"a":"1"})"))),
                 CoercionError);
}

TEST(CoercionJson, IntegerOutOfRangeThrows) {
    auto msg = coercion_message([] { (void)decode<int>(ContentType::JSON, bytes("4294967297")); });
    EXPECT_NE(msg.find("integer `4294967297`, out of range"), std::string::npos) << msg;
    EXPECT_THROW((void)decode<int8_t>(ContentType::JSON, bytes("200")), CoercionError);
}

TEST(CoercionJson, FloatIntoIntegerThrows) {
    auto msg = coercion_message([] { (void)decode<int>(ContentType::JSON, bytes("3.7")); });
    EXPECT_NE(msg.find("floating point `3.7`, expected an integer"), std::string::npos) << msg;
}

TEST(CoercionJson, BooleanIntoNumberThrows) {
    auto msg = coercion_message([] { (void)decode<int>(ContentType::JSON, bytes("true")); });
    EXPECT_NE(msg.find("boolean `true`, expected a number"), std::string::npos) << msg;
    EXPECT_THROW((void)decode<double>(ContentType::JSON, bytes("false")), CoercionError);
}

TEST(CoercionJson, NegativeIntoUnsignedFieldThrows) {
    EXPECT_THROW((void)decode<Tally>(ContentType::JSON, bytes(R"({"age":30,"count":-5})")),
                 CoercionError);
    EXPECT_THROW((void)decode<std::vector<unsigned>>(ContentType::JSON, bytes("[1,-1]")),
                 CoercionError);
}

TEST(CoercionJson, NumbersThatFitAreAccepted) {
    EXPECT_EQ(decode<int>(ContentType::JSON, bytes("-2147483648")), std::numeric_limits<int>::min());
    EXPECT_EQ(decode<uint64_t>(ContentType::JSON, bytes("18446744073709551615")),
              std::numeric_limits<uint64_t>::max());
    EXPECT_DOUBLE_EQ(decode<double>(ContentType::JSON, bytes("3")), 3.0);
    auto t = decode<Tally>(ContentType::JSON, bytes(R"({"age":30,"count":4000000000})"));
    EXPECT_EQ(t.age, 30);
    EXPECT_EQ(t.count, 4000000000u);
}

// ---- YAML ----

TEST(CoercionYaml, DecodesRecord) {
    auto p = decode<Person>(ContentType::YAML, bytes("name: Ann\nage: 30\ntags: [admin, ops]\n"));
    EXPECT_EQ(p.name, "Ann");
    EXPECT_EQ(p.age, 30);
    EXPECT_EQ(p.tags, (std::vector<std::string>{"admin", "ops"}));
}

TEST(CoercionYaml, NumericLookingNameStaysString) {
    auto g = decode<Greeting>(ContentType::YAML, bytes("name: 1234\n"));
    EXPECT_EQ(g.name, "1234");
}

TEST(CoercionYaml, RoundTrip) {
    auto out = encode_payload(ContentType::YAML, ann());
    EXPECT_EQ(out.content_type, "text/yaml");
    auto back = decode<Person>(ContentType::YAML, out.body);
    EXPECT_EQ(back.name, "Ann");
    EXPECT_EQ(back.age, 30);
    EXPECT_EQ(back.tags, ann().tags);
}

TEST(CoercionYaml, IntegerOutOfRangeThrows) {
    EXPECT_THROW((void)decode<Tally>(ContentType::YAML, bytes("age: 4294967297\ncount: 1\n")),
                 CoercionError);
}

TEST(CoercionYaml, NonFiniteFloats) {
    EXPECT_TRUE(std::isinf(decode<double>(ContentType::YAML, bytes(".inf"))));
    EXPECT_TRUE(std::isnan(decode<double>(ContentType::YAML, bytes(".nan"))));
}

TEST(CoercionYaml, SyntaxErrorThrows) {
    EXPECT_THROW((void)decode<Person>(ContentType::YAML, bytes("name: [")), CoercionError);
}

// ---- XML ----

TEST(CoercionXml, DecodesRecord) {
    auto p = decode<Person>(ContentType::XML,
        bytes("<person><name>Ann</name><age>30</age><tags>admin</tags><tags>ops</tags></person>"));
    EXPECT_EQ(p.name, "Ann");
    EXPECT_EQ(p.age, 30);
    EXPECT_EQ(p.tags, (std::vector<std::string>{"admin", "ops"}));
}

TEST(CoercionXml, SingleAndMissingSequences) {
    auto one = decode<Person>(ContentType::XML, bytes("<p><name>A</name><age>1</age><tags>x</tags></p>"));
    EXPECT_EQ(one.tags, std::vector<std::string>{"x"});
    auto none = decode<Person>(ContentType::XML, bytes("<p><name>A</name><age>1</age></p>"));
    EXPECT_TRUE(none.tags.empty());
}

TEST(CoercionXml, RoundTrip) {
    auto out = encode_payload(ContentType::XML, ann());
    EXPECT_EQ(out.content_type, "application/xml");
    EXPECT_NE(str(out.body).find("<root>"), std::string::npos);
    auto back = decode<Person>(ContentType::XML, out.body);
    EXPECT_EQ(back.name, "Ann");
    EXPECT_EQ(back.age, 30);
    EXPECT_EQ(back.tags, ann().tags);
}

TEST(CoercionXml, RootNameOption) {
    CoercionOptions options;
    options.xml_root = "person";
    auto body = encode(ContentType::XML, ann(), options);
    EXPECT_NE(str(body).find("<person><age>30</age>"), std::string::npos);
}

TEST(CoercionXml, UntypedTargetGetsInferredNumbers) {
    auto values = decode<std::map<std::string, int>>(ContentType::XML, bytes("<m><a>1</a><b>-2</b></m>"));
    EXPECT_EQ(values.at("a"), 1);
    EXPECT_EQ(values.at("b"), -2);
}

TEST(CoercionXml, FieldOutOfRangeThrows) {
    auto msg = coercion_message([] {
        (void)decode<Person>(ContentType::XML, bytes("<p><name>A</name><age>4294967297</age></p>"));
    });
    EXPECT_NE(msg.find("out of range"), std::string::npos) << msg;
    EXPECT_THROW((void)decode<Tally>(ContentType::XML, bytes("<t><age>1</age><count>-1</count></t>")),
                 CoercionError);
}

TEST(CoercionXml, MalformedThrows) {
    EXPECT_THROW((void)decode<Person>(ContentType::XML, bytes("<person><name>")), CoercionError);
}

// ---- Plain ----

TEST(CoercionPlain, EmptyBodyIsEmptyString) {
    EXPECT_EQ(decode<std::string>(ContentType::Plain, {}), "");
}

TEST(CoercionPlain, HelloWorld) {
    auto name = decode<std::string>(ContentType::Plain, bytes("world"));
    auto out = encode_payload(ContentType::Plain, "Hello " + name + "!");
    EXPECT_EQ(str(out.body), "Hello world!");
    EXPECT_EQ(out.content_type, "text/plain");
}

TEST(CoercionPlain, Numbers) {
    EXPECT_EQ(decode<int>(ContentType::Plain, bytes("42")), 42);
    EXPECT_DOUBLE_EQ(decode<double>(ContentType::Plain, bytes("2.5")), 2.5);
    EXPECT_EQ(decode<bool>(ContentType::Plain, bytes("true")), true);
    EXPECT_EQ(str(encode(ContentType::Plain, 42)), "42");
}

TEST(CoercionPlain, BadNumberThrows) {
    try {
        (void)decode<int>(ContentType::Plain, bytes("forty-two"));
        FAIL() << "Expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "invalid digit found in string: forty-two");
    }
}

TEST(CoercionPlain, IntegerOutOfRangeThrows) {
    auto msg = coercion_message([] { (void)decode<int>(ContentType::Plain, bytes("4294967297")); });
    EXPECT_NE(msg.find("integer `4294967297`, out of range"), std::string::npos) << msg;
    EXPECT_THROW((void)decode<unsigned>(ContentType::Plain, bytes("-1")), CoercionError);
    EXPECT_EQ(decode<int>(ContentType::Plain, bytes("2147483647")), 2147483647);
}

TEST(CoercionPlain, NonFiniteFloats) {
    EXPECT_TRUE(std::isnan(decode<double>(ContentType::Plain, bytes("NaN"))));
    EXPECT_EQ(decode<double>(ContentType::Plain, bytes("-infinity")),
              -std::numeric_limits<double>::infinity());
    EXPECT_EQ(str(encode(ContentType::Plain, std::numeric_limits<double>::infinity())), "inf");
    EXPECT_EQ(str(encode(ContentType::Plain, std::nan(""))), "NaN");
    // Not a number in an integer target
    EXPECT_THROW((void)decode<int>(ContentType::Plain, bytes("NaN")), CoercionError);
}

TEST(CoercionPlain, RecordsAreRejected) {
    EXPECT_THROW((void)decode<Person>(ContentType::Plain, bytes("Ann")), CoercionError);
    EXPECT_THROW((void)encode(ContentType::Plain, ann()), CoercionError);
}

TEST(CoercionPlain, NonAsciiBytesAreLatin1) {
    auto s = decode<std::string>(ContentType::Plain, Bytes{0xE9});
    EXPECT_EQ(s, "\xC3\xA9");
}

TEST(CoercionPlain, CharactersAboveLatin1AreTruncated) {
    auto body = encode(ContentType::Plain, std::string("\xE2\x82\xAC"));
    EXPECT_EQ(body, (Bytes{0xAC}));
}

TEST(CoercionPlain, AsciiRoundTrip) {
    std::string text = "plain ASCII text, with punctuation: {}[]<>&=+";
    EXPECT_EQ(decode<std::string>(ContentType::Plain, encode(ContentType::Plain, text)), text);
}

// ---- URL-encoded form ----

TEST(CoercionForm, DecodesRecord) {
    auto p = decode<Person>(ContentType::URLEncoded, bytes("name=Ann+Lee&age=30&tags=a&tags=b"));
    EXPECT_EQ(p.name, "Ann Lee");
    EXPECT_EQ(p.age, 30);
    EXPECT_EQ(p.tags, (std::vector<std::string>{"a", "b"}));
}

TEST(CoercionForm, RoundTrip) {
    auto out = encode_payload(ContentType::URLEncoded, ann());
    EXPECT_EQ(out.content_type, "application/x-www-form-urlencoded");
    EXPECT_EQ(str(out.body), "age=30&name=Ann&tags=admin&tags=ops");
    auto back = decode<Person>(ContentType::URLEncoded, out.body);
    EXPECT_EQ(back.name, "Ann");
    EXPECT_EQ(back.tags, ann().tags);
}

TEST(CoercionForm, UntypedTargetGetsInferredNumbers) {
    auto values = decode<std::map<std::string, int>>(ContentType::URLEncoded, bytes("a=1&b=2"));
    EXPECT_EQ(values.at("a"), 1);
    EXPECT_EQ(values.at("b"), 2);
}

TEST(CoercionForm, FirstErrorIsReported) {
    try {
        (void)decode<std::map<std::string, int>>(ContentType::URLEncoded, bytes("a=x"));
        FAIL() << "Expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_NE(std::string(e.what()).find("type must be number"), std::string::npos);
    }
}

TEST(CoercionForm, FieldOutOfRangeThrows) {
    EXPECT_THROW((void)decode<Tally>(ContentType::URLEncoded, bytes("age=4294967297&count=1")),
                 CoercionError);
    EXPECT_THROW((void)decode<Tally>(ContentType::URLEncoded, bytes("age=1&count=-3")),
                 CoercionError);
}

TEST(CoercionForm, LiteralPercentSigns) {
    auto values = decode<std::map<std::string, std::string>>(
        ContentType::URLEncoded, bytes("q=100%&discount=50%25&note=5%off"));
    EXPECT_EQ(values.at("q"), "100%");
    EXPECT_EQ(values.at("discount"), "50%");
    EXPECT_EQ(values.at("note"), "5%off");
}

TEST(CoercionForm, InvalidUtf8EscapesReencodeAsJson) {
    auto values = decode<std::map<std::string, std::string>>(
        ContentType::URLEncoded, bytes("name=%E9&ok=%C3%A9"));
    EXPECT_EQ(values.at("name"), "\xEF\xBF\xBD");
    EXPECT_EQ(values.at("ok"), "\xC3\xA9");
    auto out = encode_payload(ContentType::JSON, values);
    EXPECT_EQ(nlohmann::json::parse(str(out.body)).at("name"), "\xEF\xBF\xBD");
}

TEST(CoercionForm, NonObjectValueRejected) {
    EXPECT_THROW((void)encode(ContentType::URLEncoded, std::string("Hello")), CoercionError);
}

// ---- Dispatch ----

TEST(CoercionDispatch, DecodePayloadClassifies) {
    auto g = decode_payload<Greeting>("application/yaml", bytes("name: Ann"));
    EXPECT_EQ(g.name, "Ann");
    // Unknown types are read as JSON
    auto j = decode_payload<Greeting>("application/octet-stream", bytes(R"({"name":"Bo"})"));
    EXPECT_EQ(j.name, "Bo");
}

TEST(CoercionDispatch, DecodePayloadRejectPolicy) {
    EXPECT_THROW((void)decode_payload<Greeting>("application/octet-stream", bytes(R"({"name":"Bo"})"),
                                                ContentTypePolicy::Reject),
                 CoercionError);
}

TEST(CoercionDispatch, TypesWithoutDefaultConstructorEncode) {
    auto out = encode_payload(ContentType::JSON, Reading(1.5));
    EXPECT_EQ(str(out.body), R"({"value":1.5})");
}

TEST(CoercionDispatch, EveryTypeEncodesAString) {
    // Form is the only format that cannot hold a bare string
    for (auto t : {ContentType::JSON, ContentType::YAML, ContentType::XML, ContentType::Plain}) {
        EXPECT_NO_THROW((void)encode(t, std::string("hi"))) << content_type_name(t);
    }
}

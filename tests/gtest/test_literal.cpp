// =============================================================================
// Literal Formatting Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/ttl/literal.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace ifc2lbd;
using namespace ifc2lbd::ttl;

class LiteralTest : public ::testing::Test {
protected:
    // Undo escape_string for the ECHAR subset
    static std::string unescape(const std::string& s) {
        std::string out;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '\\' || i + 1 >= s.size()) {
                out += s[i];
                continue;
            }
            switch (s[++i]) {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                default:  out += s[i]; break;
            }
        }
        return out;
    }
};

TEST_F(LiteralTest, Scalars) {
    EXPECT_EQ(format_string("Oak"), "\"Oak\"");
    EXPECT_EQ(format_integer(5), "\"5\"^^xsd:integer");
    EXPECT_EQ(format_integer(-12), "\"-12\"^^xsd:integer");
    EXPECT_EQ(format_boolean(true), "\"true\"^^xsd:boolean");
    EXPECT_EQ(format_boolean(false), "\"false\"^^xsd:boolean");
}

TEST_F(LiteralTest, ScientificDoubles) {
    EXPECT_EQ(double_lexical(0.584, FloatFormat::Scientific), "5.840000000000000E-1");
    EXPECT_EQ(double_lexical(1.5, FloatFormat::Scientific), "1.500000000000000E0");
    EXPECT_EQ(double_lexical(0.0, FloatFormat::Scientific), "0.000000000000000E0");
    EXPECT_EQ(double_lexical(-2500.0, FloatFormat::Scientific), "-2.500000000000000E3");
    EXPECT_EQ(double_lexical(1e-10, FloatFormat::Scientific), "1.000000000000000E-10");
    EXPECT_EQ(double_lexical(1e100, FloatFormat::Scientific), "1.000000000000000E100");
    EXPECT_EQ(format_double(0.584, FloatFormat::Scientific), "\"5.840000000000000E-1\"^^xsd:double");
}

TEST_F(LiteralTest, PlainDoubles) {
    EXPECT_EQ(double_lexical(0.584, FloatFormat::Plain), "0.584");
    EXPECT_EQ(double_lexical(1.0, FloatFormat::Plain), "1.0");
    EXPECT_EQ(double_lexical(-3.0, FloatFormat::Plain), "-3.0");
    EXPECT_EQ(double_lexical(0.1, FloatFormat::Plain), "0.1");
    EXPECT_EQ(double_lexical(123456.0, FloatFormat::Plain), "123456.0");
    EXPECT_EQ(double_lexical(1e20, FloatFormat::Plain), "1e+20");
    EXPECT_EQ(double_lexical(-2.5e-7, FloatFormat::Plain), "-2.5e-07");
}

TEST_F(LiteralTest, NonFiniteDoubles) {
    const double inf = std::numeric_limits<double>::infinity();
    for (FloatFormat f : {FloatFormat::Scientific, FloatFormat::Plain}) {
        EXPECT_EQ(double_lexical(inf, f), "INF");
        EXPECT_EQ(double_lexical(-inf, f), "-INF");
        EXPECT_EQ(double_lexical(std::nan(""), f), "NaN");
    }
}

// Decoding either rendering recovers the value
TEST_F(LiteralTest, DoubleRoundTrip) {
    const double values[] = {0.584, 1.0 / 3.0, -123456.789, 6.02214076e23, 1e-300, 42.0};
    for (double v : values) {
        EXPECT_EQ(std::stod(double_lexical(v, FloatFormat::Plain)), v);
        EXPECT_NEAR(std::stod(double_lexical(v, FloatFormat::Scientific)), v, std::fabs(v) * 1e-15);
    }
}

TEST_F(LiteralTest, StringEscaping) {
    EXPECT_EQ(escape_string("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(escape_string("a\\b"), "a\\\\b");
    EXPECT_EQ(escape_string("line1\nline2\r\t"), "line1\\nline2\\r\\t");
    EXPECT_EQ(escape_string(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape_string("W\xC3\xA4nde"), "W\xC3\xA4nde");

    const std::string tricky = "quote\" slash\\ tab\t nl\n ff\f bs\b";
    EXPECT_EQ(unescape(escape_string(tricky)), tricky);
}

TEST_F(LiteralTest, FloatFormatNames) {
    EXPECT_EQ(parse_float_format("scientific"), FloatFormat::Scientific);
    EXPECT_EQ(parse_float_format("plain"), FloatFormat::Plain);
    EXPECT_STREQ(float_format_name(FloatFormat::Plain), "plain");
    EXPECT_THROW(parse_float_format("engineering"), ConfigurationError);
}

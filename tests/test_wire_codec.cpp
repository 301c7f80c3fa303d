#include "cborkit/utils/hex.hpp"
#include "cborkit/wire/codec.hpp"
#include "cborkit/wire/reader.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

using cborkit::wire::Array;
using cborkit::wire::DecodeFailure;
using cborkit::wire::DecodeOptions;
using cborkit::wire::EncodeOptions;
using cborkit::wire::Entry;
using cborkit::wire::Value;
using cborkit::wire::errc;
using cborkit::wire::major_type;

std::vector<std::uint8_t> hex(std::string_view text) {
  std::vector<std::uint8_t> out;
  TEST_EXPECT_OK(cborkit::utils::parse_hex(text, out));
  return out;
}

struct Vector {
  Value value;
  std::string_view hex;
};

void expect_vector(const Vector& v, const EncodeOptions& options = {}) {
  const auto expected = hex(v.hex);
  const auto encoded = cborkit::wire::encode(v.value, options);
  if (encoded != expected) {
    TEST_FAIL("encode mismatch for " + std::string(v.hex) + ", got " + cborkit::utils::to_hex(encoded));
  }
  TEST_EXPECT_EQ(cborkit::wire::encoded_size(v.value, options), expected.size());

  auto decoded = Value::undefined();
  TEST_EXPECT_OK(cborkit::wire::decode(expected, decoded));
  TEST_EXPECT(decoded == v.value);
}

void test_rfc_integer_and_string_vectors() {
  const Vector vectors[] = {
    {Value::uint64(0), "00"},
    {Value::uint64(1), "01"},
    {Value::uint64(10), "0a"},
    {Value::uint64(23), "17"},
    {Value::uint64(24), "1818"},
    {Value::uint64(25), "1819"},
    {Value::uint64(100), "1864"},
    {Value::uint64(1000), "1903e8"},
    {Value::uint64(1000000), "1a000f4240"},
    {Value::uint64(1000000000000ull), "1b000000e8d4a51000"},
    {Value::uint64(std::numeric_limits<std::uint64_t>::max()), "1bffffffffffffffff"},
    {Value::negative(std::numeric_limits<std::uint64_t>::max()), "3bffffffffffffffff"},
    {Value::integer(-1), "20"},
    {Value::integer(-10), "29"},
    {Value::integer(-100), "3863"},
    {Value::integer(-1000), "3903e7"},
    {Value::integer(std::numeric_limits<std::int64_t>::min()), "3b7fffffffffffffff"},
    {Value::boolean(false), "f4"},
    {Value::boolean(true), "f5"},
    {Value::null(), "f6"},
    {Value::undefined(), "f7"},
    {Value::bytes({}), "40"},
    {Value::bytes({1, 2, 3, 4}), "4401020304"},
    {Value::text(""), "60"},
    {Value::text("a"), "6161"},
    {Value::text("IETF"), "6449455446"},
    {Value::text("\"\\"), "62225c"},
    {Value::text("\xc3\xbc"), "62c3bc"},
    {Value::text("\xe6\xb0\xb4"), "63e6b0b4"},
  };
  for (const auto& v : vectors) {
    expect_vector(v);
  }
}

void test_rfc_container_vectors() {
  const Vector vectors[] = {
    {Value::array({}), "80"},
    {Value::array({Value::uint64(1), Value::uint64(2), Value::uint64(3)}), "83010203"},
    {Value::array({Value::uint64(1),
                   Value::array({Value::uint64(2), Value::uint64(3)}),
                   Value::array({Value::uint64(4), Value::uint64(5)})}),
     "8301820203820405"},
    {Value::map({}), "a0"},
    {Value::map({Entry{Value::uint64(1), Value::uint64(2)}, Entry{Value::uint64(3), Value::uint64(4)}}),
     "a201020304"},
    {Value::map({Entry{Value::text("a"), Value::uint64(1)},
                 Entry{Value::text("b"), Value::array({Value::uint64(2), Value::uint64(3)})}}),
     "a26161016162820203"},
    {Value::array({Value::text("a"), Value::map({Entry{Value::text("b"), Value::text("c")}})}),
     "826161a161626163"},
  };
  for (const auto& v : vectors) {
    expect_vector(v);
  }

  // 25 个元素：计数需要 1 字节扩展参数。
  Array items;
  for (std::uint64_t i = 1; i <= 25; ++i) {
    items.push_back(Value::uint64(i));
  }
  expect_vector({Value::array(items), "98190102030405060708090a0b0c0d0e0f101112131415161718181819"});
}

void test_float_encoding() {
  // 默认总是 double。
  expect_vector({Value::floating(1.5), "fb3ff8000000000000"});
  expect_vector({Value::floating(1.1), "fb3ff199999999999a"});
  expect_vector({Value::floating(1.0e300), "fb7e37e43c8800759c"});

  EncodeOptions minimal;
  minimal.minimal_floats = true;
  const Vector vectors[] = {
    {Value::floating(0.0), "f90000"},
    {Value::floating(-0.0), "f98000"},
    {Value::floating(1.5), "f93e00"},
    {Value::floating(65504.0), "f97bff"},
    {Value::floating(100000.0), "fa47c35000"},
    {Value::floating(3.4028234663852886e+38), "fa7f7fffff"},
    {Value::floating(1.1), "fb3ff199999999999a"},
    {Value::floating(5.960464477539063e-8), "f90001"},
    {Value::floating(-4.0), "f9c400"},
    {Value::floating(std::numeric_limits<double>::infinity()), "f97c00"},
    {Value::floating(std::numeric_limits<double>::quiet_NaN()), "f97e00"},
  };
  for (const auto& v : vectors) {
    expect_vector(v, minimal);
  }

  // 任何宽度的浮点都解码为 Float，且保留位模式。
  auto out = Value::null();
  TEST_EXPECT_OK(cborkit::wire::decode(hex("fa47c35000"), out));
  TEST_EXPECT(out == Value::floating(100000.0));
  TEST_EXPECT_OK(cborkit::wire::decode(hex("f97e00"), out));
  TEST_EXPECT(out == Value::floating(std::numeric_limits<double>::quiet_NaN()));
}

void test_string_length_scaling() {
  struct Case {
    std::size_t length;
    std::size_t header;
  };
  const Case cases[] = {{0, 1}, {1, 1}, {23, 1}, {24, 2}, {255, 2}, {256, 3}, {70000, 5}};
  for (const auto& c : cases) {
    const auto text = Value::text(std::string(c.length, 'x'));
    const auto encoded = cborkit::wire::encode(text);
    TEST_EXPECT_EQ(encoded.size(), c.header + c.length);

    auto out = Value::null();
    TEST_EXPECT_OK(cborkit::wire::decode(encoded, out));
    TEST_EXPECT(out == text);
  }
}

void test_encode_appends() {
  std::vector<std::uint8_t> out{0xaa};
  cborkit::wire::encode(Value::text("a"), out);
  TEST_EXPECT(out == hex("aa 61 61"));
}

void test_truncated_input_is_eof() {
  const auto value = Value::map({
    Entry{Value::text("id"), Value::uint64(1000000)},
    Entry{Value::text("name"), Value::text("sensor")},
    Entry{Value::text("data"), Value::array({Value::floating(2.5), Value::bytes({9, 8, 7}), Value::null()})},
    Entry{Value::text("neg"), Value::integer(-70000)},
  });
  const auto full = cborkit::wire::encode(value);

  for (std::size_t n = 0; n < full.size(); ++n) {
    const cborkit::wire::bytes_view prefix(full.data(), n);
    auto out = Value::text("untouched");
    std::size_t consumed = 123;
    const auto ec = cborkit::wire::decode_one(prefix, out, consumed);
    TEST_EXPECT_ERR(ec, errc::unexpected_eof);
    TEST_EXPECT(out == Value::text("untouched"));
    TEST_EXPECT_EQ(consumed, 0u);
  }

  auto out = Value::null();
  TEST_EXPECT_OK(cborkit::wire::decode(full, out));
  TEST_EXPECT(out == value);
}

void test_forged_lengths_do_not_allocate() {
  auto out = Value::null();
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("9b ffffffffffffffff"), out), errc::unexpected_eof);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("bb 00000000ffffffff 01"), out), errc::unexpected_eof);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("5b ffffffffffffffff 00"), out), errc::unexpected_eof);
}

void test_invalid_utf8() {
  auto out = Value::null();
  DecodeFailure failure;
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("62 c3 28"), out, {}, &failure), errc::invalid_utf8);
  TEST_EXPECT_EQ(failure.offset, 0u);

  // overlong 编码与代理区码点同样拒绝。
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("62 c0 af"), out), errc::invalid_utf8);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("63 ed a0 80"), out), errc::invalid_utf8);

  // 嵌套位置的偏移指向该 text 的首部。
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("82 01 61 ff"), out, {}, &failure), errc::invalid_utf8);
  TEST_EXPECT_EQ(failure.offset, 2u);

  DecodeOptions relaxed;
  relaxed.validate_utf8 = false;
  TEST_EXPECT_OK(cborkit::wire::decode(hex("62 c3 28"), out, relaxed));
  TEST_EXPECT(out.is<cborkit::wire::Text>());
}

void test_indefinite_length() {
  auto out = Value::null();
  TEST_EXPECT_OK(cborkit::wire::decode(hex("5f42010243030405ff"), out));
  TEST_EXPECT(out == Value::bytes({1, 2, 3, 4, 5}));

  TEST_EXPECT_OK(cborkit::wire::decode(hex("7f657374726561646d696e67ff"), out));
  TEST_EXPECT(out == Value::text("streaming"));

  TEST_EXPECT_OK(cborkit::wire::decode(hex("9fff"), out));
  TEST_EXPECT(out == Value::array({}));

  TEST_EXPECT_OK(cborkit::wire::decode(hex("9f018202039f0405ffff"), out));
  TEST_EXPECT(out == Value::array({Value::uint64(1),
                                   Value::array({Value::uint64(2), Value::uint64(3)}),
                                   Value::array({Value::uint64(4), Value::uint64(5)})}));

  TEST_EXPECT_OK(cborkit::wire::decode(hex("bf61610161629f0203ffff"), out));
  TEST_EXPECT(out == Value::map({Entry{Value::text("a"), Value::uint64(1)},
                                 Entry{Value::text("b"), Value::array({Value::uint64(2), Value::uint64(3)})}}));

  // 分块主类型不一致。
  DecodeFailure failure;
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("5f 61 61 ff"), out, {}, &failure), errc::type_mismatch);
  TEST_EXPECT(failure.expected == major_type::byte_string);
  TEST_EXPECT(failure.actual == major_type::text_string);

  DecodeOptions definite_only;
  definite_only.allow_indefinite = false;
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("9fff"), out, definite_only), errc::indefinite_not_allowed);

  // 整数不允许 indefinite。
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("1f"), out), errc::invalid_additional_info);
}

void test_malformed_heads() {
  auto out = Value::null();
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("1c"), out), errc::invalid_additional_info);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("ff"), out), errc::unexpected_break);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("82 01 ff"), out), errc::unexpected_break);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("f8 20"), out), errc::invalid_simple);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("f0"), out), errc::invalid_simple);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("c1 1a 514b67b0"), out), errc::unsupported_tag);
}

void test_limits() {
  const auto nested = hex("81 81 81 01");  // [[[1]]]
  auto out = Value::null();

  DecodeOptions options;
  options.max_depth = 2;
  DecodeFailure failure;
  TEST_EXPECT_ERR(cborkit::wire::decode(nested, out, options, &failure), errc::depth_exceeded);
  TEST_EXPECT_EQ(failure.offset, 2u);

  options.max_depth = 3;
  TEST_EXPECT_OK(cborkit::wire::decode(nested, out, options));

  // 不设上限时深嵌套也能往返。
  auto deep = Value::uint64(7);
  for (int i = 0; i < 500; ++i) {
    deep = Value::array({deep});
  }
  const auto deep_bytes = cborkit::wire::encode(deep);
  TEST_EXPECT_OK(cborkit::wire::decode(deep_bytes, out));
  TEST_EXPECT(out == deep);

  // 两百万层单元素数组：设置 max_depth 后在第 257 层停止，不会递归到底。
  std::vector<std::uint8_t> hostile(2'000'000, 0x81);
  hostile.push_back(0x01);
  DecodeOptions guarded;
  guarded.max_depth = 256;
  out = Value::uint64(9);
  TEST_EXPECT_ERR(cborkit::wire::decode(hostile, out, guarded, &failure), errc::depth_exceeded);
  TEST_EXPECT_EQ(failure.offset, 256u);
  TEST_EXPECT(out == Value::uint64(9));
  cborkit::wire::Reader skipper(hostile, guarded);
  TEST_EXPECT_ERR(skipper.skip_value(), errc::depth_exceeded);

  DecodeOptions small;
  small.max_collection_size = 2;
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("83010203"), out, small), errc::limit_exceeded);
  TEST_EXPECT_OK(cborkit::wire::decode(hex("820102"), out, small));

  small.max_string_length = 3;
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("6449455446"), out, small), errc::limit_exceeded);
  TEST_EXPECT_ERR(cborkit::wire::decode(hex("7f 62 4945 62 5446 ff"), out, small), errc::limit_exceeded);
}

void test_decode_one_and_trailing_bytes() {
  const auto stream = hex("01 6161 f5");

  auto out = Value::null();
  std::size_t consumed = 0;
  TEST_EXPECT_OK(cborkit::wire::decode_one(stream, out, consumed));
  TEST_EXPECT(out == Value::uint64(1));
  TEST_EXPECT_EQ(consumed, 1u);

  const auto rest = cborkit::wire::bytes_view(stream).subspan(consumed);
  TEST_EXPECT_OK(cborkit::wire::decode_one(rest, out, consumed));
  TEST_EXPECT(out == Value::text("a"));
  TEST_EXPECT_EQ(consumed, 2u);

  DecodeFailure failure;
  auto whole = Value::null();
  TEST_EXPECT_ERR(cborkit::wire::decode(stream, whole, {}, &failure), errc::trailing_bytes);
  TEST_EXPECT_EQ(failure.offset, 1u);
  TEST_EXPECT(whole == Value::null());
}

void test_extract_field() {
  const auto encoded = hex("a3 6161 01 01 02 6162 820203");  // {"a": 1, 1: 2, "b": [2, 3]}

  auto out = Value::null();
  bool found = false;
  TEST_EXPECT_OK(cborkit::wire::extract_field(encoded, "b", out, found));
  TEST_EXPECT(found);
  TEST_EXPECT(out == Value::array({Value::uint64(2), Value::uint64(3)}));

  TEST_EXPECT_OK(cborkit::wire::extract_field(encoded, "missing", out, found));
  TEST_EXPECT(!found);

  TEST_EXPECT_OK(cborkit::wire::extract_field(hex("bf 6161 01 6162 f5 ff"), "b", out, found));
  TEST_EXPECT(found);
  TEST_EXPECT(out == Value::boolean(true));

  DecodeFailure failure;
  TEST_EXPECT_ERR(cborkit::wire::extract_field(hex("83010203"), "a", out, found, {}, &failure), errc::type_mismatch);
  TEST_EXPECT(failure.expected == major_type::map);
  TEST_EXPECT(failure.actual == major_type::array);
}

}  // namespace

int main() {
  test_rfc_integer_and_string_vectors();
  test_rfc_container_vectors();
  test_float_encoding();
  test_string_length_scaling();
  test_encode_appends();
  test_truncated_input_is_eof();
  test_forged_lengths_do_not_allocate();
  test_invalid_utf8();
  test_indefinite_length();
  test_malformed_heads();
  test_limits();
  test_decode_one_and_trailing_bytes();
  test_extract_field();
  return ::cborkit::tests::run_and_report();
}

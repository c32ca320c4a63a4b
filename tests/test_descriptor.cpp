#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/EngineConfig.hpp"
#include "core/descriptor/DescriptorCodec.hpp"

using namespace alib;

static ArchiveRecord sample_record() {
  ArchiveRecord r;
  r.id = "3f9a0c1d2e4b5a69";
  r.source_path = "/home/me/photos 2019";
  r.created_at = 1700000000;
  r.description = "Holiday photos; Lisbon & Porto = 100% fun";
  r.files = {{"a.jpg", 10}, {"b/c.jpg", 20}, {"d.txt", 3}};
  r.payload_checksum = std::string(64, 'a');
  r.payload_size = 33;
  return r;
}

static bool printable_ascii(const std::string& s) {
  for (unsigned char c : s) if (c < 0x20 || c > 0x7E) return false;
  return true;
}

TEST(Descriptor, RoundTripsAllFields) {
  const ArchiveRecord r = sample_record();
  const std::string text = encode_descriptor(r);
  EXPECT_TRUE(printable_ascii(text));
  EXPECT_LE(text.size(), kMaxDescriptorBytes);

  const DecodedDescriptor d = decode_descriptor(text);
  EXPECT_EQ(d.version, 2);
  EXPECT_EQ(d.id, r.id);
  EXPECT_EQ(d.file_count, 3u);
  EXPECT_EQ(d.checksum, r.payload_checksum);
  EXPECT_EQ(d.description, r.description);
  EXPECT_FALSE(d.description_truncated);
  ASSERT_TRUE(d.created_at.has_value());
  EXPECT_EQ(*d.created_at, r.created_at);
  ASSERT_TRUE(d.source_path.has_value());
  EXPECT_EQ(*d.source_path, r.source_path);
}

TEST(Descriptor, IsDeterministic) {
  EXPECT_EQ(encode_descriptor(sample_record()), encode_descriptor(sample_record()));
}

TEST(Descriptor, NonAsciiIsEscaped) {
  ArchiveRecord r = sample_record();
  r.description = "Fotos de f\xC3\xA9rias ~ ver\xC3\xA3o\n";
  const std::string text = encode_descriptor(r);
  EXPECT_TRUE(printable_ascii(text));
  const DecodedDescriptor d = decode_descriptor(text);
  EXPECT_EQ(d.description, r.description);
  EXPECT_FALSE(d.description_truncated);
}

TEST(Descriptor, LongDescriptionDropsOptionalFieldsThenTruncates) {
  ArchiveRecord r = sample_record();
  r.description = std::string(3000, 'x') + "\xE2\x82\xAC";
  const std::string text = encode_descriptor(r);
  EXPECT_LE(text.size(), kMaxDescriptorBytes);
  EXPECT_TRUE(printable_ascii(text));

  const DecodedDescriptor d = decode_descriptor(text);
  EXPECT_EQ(d.id, r.id);
  EXPECT_EQ(d.file_count, r.files.size());
  EXPECT_EQ(d.checksum, r.payload_checksum);
  EXPECT_TRUE(d.description_truncated);
  EXPECT_FALSE(d.source_path.has_value());
  EXPECT_FALSE(d.created_at.has_value());
  ASSERT_FALSE(d.description.empty());
  EXPECT_EQ(r.description.compare(0, d.description.size(), d.description), 0);
}

TEST(Descriptor, TruncationNeverSplitsAnEscape) {
  ArchiveRecord r = sample_record();
  r.description.clear();
  for (int i = 0; i < 600; ++i) r.description += "\xC3\xA9";  // each byte escapes to 3 chars
  const DecodedDescriptor d = decode_descriptor(encode_descriptor(r));
  EXPECT_TRUE(d.description_truncated);
  EXPECT_EQ(r.description.compare(0, d.description.size(), d.description), 0);
  EXPECT_EQ(d.description.find('%'), std::string::npos);
}

TEST(Descriptor, ReadsLegacyTags) {
  const DecodedDescriptor d =
    decode_descriptor("archive=abc123;files=4;checksum=ffee;desc=old%20backup;future=1");
  EXPECT_EQ(d.version, 1);
  EXPECT_EQ(d.id, "abc123");
  EXPECT_EQ(d.file_count, 4u);
  EXPECT_EQ(d.checksum, "ffee");
  EXPECT_EQ(d.description, "old backup");
}

TEST(Descriptor, UnknownTagsAreIgnored) {
  const DecodedDescriptor d = decode_descriptor("v=3;id=abc;n=1;sum=00;color=blue;d=x");
  EXPECT_EQ(d.version, 3);
  EXPECT_EQ(d.id, "abc");
  EXPECT_EQ(d.description, "x");
}

TEST(Descriptor, MissingStructuralFieldsAreRejected) {
  EXPECT_THROW(decode_descriptor("v=2;n=1;sum=00"), ValidationError);
  EXPECT_THROW(decode_descriptor("v=2;id=abc;sum=00"), ValidationError);
  EXPECT_THROW(decode_descriptor("v=2;id=abc;n=1"), ValidationError);
  EXPECT_THROW(decode_descriptor(""), ValidationError);
}

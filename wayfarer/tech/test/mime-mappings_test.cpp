#include "wayfarer/mime-mappings.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <iterator>

using namespace wayfarer;

TEST(MIMEMappings, ContainsKnownExtension) {
  auto idx = DetermineMIMETypeIdx("file.html");
  ASSERT_NE(idx, kUnknownMIMEMappingIdx);
  EXPECT_EQ(kMIMEMappings[idx].mimeType, "text/html");
  EXPECT_TRUE(kMIMEMappings[idx].compressible);

  idx = DetermineMIMETypeIdx("image.jpeg");
  ASSERT_NE(idx, kUnknownMIMEMappingIdx);
  EXPECT_EQ(kMIMEMappings[idx].mimeType, "image/jpeg");
  EXPECT_FALSE(kMIMEMappings[idx].compressible);
}

TEST(MIMEMappings, UnknownExtension) {
  EXPECT_EQ(DetermineMIMETypeIdx("file.unknownext"), kUnknownMIMEMappingIdx);
  EXPECT_EQ(DetermineMIMETypeIdx("file.zzz"), kUnknownMIMEMappingIdx);
  EXPECT_EQ(DetermineMIMETypeIdx("README"), kUnknownMIMEMappingIdx);
  EXPECT_EQ(DetermineMIMETypeStr("noext"), "");
}

TEST(MIMEMappings, DotInDirectoryIsNotAnExtension) {
  EXPECT_EQ(DetermineMIMETypeIdx("/srv/site.v2/README"), kUnknownMIMEMappingIdx);
}

TEST(MIMEMappings, CaseInsensitiveExtensions) {
  EXPECT_EQ(DetermineMIMETypeIdx("UPPER.HTML"), DetermineMIMETypeIdx("upper.html"));
}

TEST(MIMEMappings, MultiDotFilenames) { EXPECT_EQ(DetermineMIMETypeStr("archive.tar.gz"), "application/gzip"); }

TEST(MIMEMappings, ByExtensionWithOrWithoutDot) {
  EXPECT_EQ(FindMIMETypeIdxByExtension("css"), FindMIMETypeIdxByExtension(".CSS"));
  EXPECT_NE(FindMIMETypeIdxByExtension("css"), kUnknownMIMEMappingIdx);
  EXPECT_EQ(FindMIMETypeIdxByExtension(""), kUnknownMIMEMappingIdx);
  EXPECT_EQ(FindMIMETypeIdxByExtension("."), kUnknownMIMEMappingIdx);
}

TEST(MIMEMappings, SortedAndUnique) {
  const std::size_t nbMappings = std::size(kMIMEMappings);
  for (std::size_t i = 1; i < nbMappings; ++i) {
    EXPECT_LT(kMIMEMappings[i - 1].extension, kMIMEMappings[i].extension)
        << "Mappings not strictly increasing at index " << (i - 1);
  }
}

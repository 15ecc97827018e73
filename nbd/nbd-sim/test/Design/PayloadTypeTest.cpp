// Ticket: 0001_efficiency_model

#include <gtest/gtest.h>

#include <string>

#include "nbd-sim/src/Design/PayloadType.hpp"

using namespace nbd_sim;

TEST(PayloadType, ToString_CanonicalNames)
{
  EXPECT_EQ(toString(PayloadType::SmallMolecules), "small_molecules");
  EXPECT_EQ(toString(PayloadType::MRNA), "mRNA");
  EXPECT_EQ(toString(PayloadType::Proteins), "proteins");
  EXPECT_EQ(toString(PayloadType::Plasmids), "plasmids");
}

TEST(PayloadType, Parse_CanonicalNames)
{
  EXPECT_EQ(parsePayloadType("small_molecules"), PayloadType::SmallMolecules);
  EXPECT_EQ(parsePayloadType("mRNA"), PayloadType::MRNA);
  EXPECT_EQ(parsePayloadType("proteins"), PayloadType::Proteins);
  EXPECT_EQ(parsePayloadType("plasmids"), PayloadType::Plasmids);
}

TEST(PayloadType, Parse_NameOfEveryValue_RoundTrips)
{
  for (PayloadType const payload : {PayloadType::SmallMolecules,
                                    PayloadType::MRNA,
                                    PayloadType::Proteins,
                                    PayloadType::Plasmids})
  {
    std::string const name{toString(payload)};
    EXPECT_EQ(parsePayloadType(name), payload) << name;
  }
}

TEST(PayloadType, Parse_UnknownName_FallsBackToMRNA)
{
  EXPECT_EQ(parsePayloadType("antibodies"), PayloadType::MRNA);
  EXPECT_EQ(parsePayloadType(""), PayloadType::MRNA);
}

TEST(PayloadType, Parse_IsCaseSensitive)
{
  EXPECT_EQ(parsePayloadType("Proteins"), PayloadType::MRNA);
  EXPECT_EQ(parsePayloadType("PLASMIDS"), PayloadType::MRNA);
}

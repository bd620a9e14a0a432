#include "sampling/core/completeness.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace boothsampler::sampling::core {
namespace gtest {

TEST(Completeness, TargetReached) {
	const Completeness c = evaluateCompleteness(24, 12, 60, false);
	EXPECT_TRUE(c.complete);
	EXPECT_EQ(c.cause, Incompleteness::None);
	EXPECT_TRUE(reasonText(c.cause).empty());
}

TEST(Completeness, NoBooths) {
	const Completeness c = evaluateCompleteness(0, 12, 0, false);
	EXPECT_FALSE(c.complete);
	EXPECT_EQ(c.cause, Incompleteness::NoBoothsInBoundary);
	EXPECT_EQ(reasonText(c.cause), "no booths found within boundary");
}

TEST(Completeness, FewerBoothsThanTarget_IsInsufficient) {
	const Completeness c = evaluateCompleteness(20, 12, 20, false);
	EXPECT_FALSE(c.complete);
	EXPECT_EQ(c.cause, Incompleteness::InsufficientBooths);
	EXPECT_NE(reasonText(c.cause).find("insufficient"), std::string_view::npos);
}

TEST(Completeness, ReducedClusterCount_TakesPrecedence) {
	const Completeness c = evaluateCompleteness(5, 12, 5, true);
	EXPECT_FALSE(c.complete);
	EXPECT_EQ(c.cause, Incompleteness::ClusterCountReduced);
	EXPECT_NE(reasonText(c.cause).find("insufficient"), std::string_view::npos);
}

TEST(Completeness, EnoughBoothsButSparseClusters) {
	const Completeness c = evaluateCompleteness(23, 12, 60, false);
	EXPECT_FALSE(c.complete);
	EXPECT_EQ(c.cause, Incompleteness::SparseClusters);
}

TEST(Completeness, ReasonsAreDistinct) {
	const std::set<std::string_view> reasons = {
	        reasonText(Incompleteness::NoBoothsInBoundary), reasonText(Incompleteness::InsufficientBooths), reasonText(Incompleteness::ClusterCountReduced),
	        reasonText(Incompleteness::SparseClusters),     reasonText(Incompleteness::MissingReference),   reasonText(Incompleteness::ReprojectionFailed),
	        reasonText(Incompleteness::ClusteringFailed),
	};
	EXPECT_EQ(reasons.size(), 7u);
	EXPECT_EQ(reasons.count(""), 0u);
}

} // namespace gtest
} // namespace boothsampler::sampling::core

#include <gtest/gtest.h>
#include "core/DocumentationIndex.h"
#include "core/IdentityKey.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

DiscoveredAsset asset_with(const std::string& id, const std::vector<std::string>& locators) {
    DiscoveredAsset a;
    a.asset_id = id;
    a.locators = locators;
    for (const auto& l : locators) a.identity_keys.push_back(identity_key(l));
    std::sort(a.identity_keys.begin(), a.identity_keys.end());
    return a;
}

}

class DocumentationIndexTest : public ::testing::Test {
protected:
    std::vector<ValidationError> errors;
};

TEST_F(DocumentationIndexTest, ParsesValidEntries) {
    std::vector<std::string> lines = {
        "# catalogue export",
        "asset=/srv/data/app.sqlite",
        "completeness=0.9",
        "last_updated=2024-05-01",
        "owner=payments",
        "",
        "asset=asset-0123456789abcdef",
        "completeness=0.4",
        "last_updated=2024-05-01T10:00:00Z",
    };
    auto idx = DocumentationIndex::parse(lines, "catalog.doc", errors);
    EXPECT_TRUE(errors.empty());
    ASSERT_EQ(idx.entries().size(), 2u);
    EXPECT_EQ(idx.entries()[0].identity, "file:/srv/data/app.sqlite");
    EXPECT_DOUBLE_EQ(idx.entries()[0].completeness_score, 0.9);
    EXPECT_EQ(idx.entries()[0].owner, "payments");
    EXPECT_EQ(idx.entries()[0].line, 2u);
    EXPECT_EQ(idx.entries()[1].key, "asset-0123456789abcdef");
}

TEST_F(DocumentationIndexTest, RejectsBadEntriesButKeepsTheRest) {
    std::vector<std::string> lines = {
        "asset=",
        "completeness=0.5",
        "last_updated=2024-01-01",
        "asset=a",
        "completeness=1.5",
        "last_updated=2024-01-01",
        "asset=b",
        "completeness=0.5",
        "last_updated=last tuesday",
        "asset=c",
        "last_updated=2024-01-01",
        "asset=d",
        "completeness=0.5",
        "this line has no equals sign",
        "last_updated=2024-01-01",
        "asset=ok",
        "completeness=0.5",
        "last_updated=2024-01-01",
    };
    auto idx = DocumentationIndex::parse(lines, "bad.doc", errors);
    ASSERT_EQ(idx.entries().size(), 1u);
    EXPECT_EQ(idx.entries()[0].key, "ok");
    ASSERT_EQ(errors.size(), 5u);
    for (const auto& e : errors) {
        EXPECT_EQ(e.code, WarnCode::InvalidDocumentationEntry);
        EXPECT_EQ(e.source, "bad.doc");
    }
    EXPECT_EQ(errors[0].line, 1u);
}

TEST_F(DocumentationIndexTest, UnresolvableKeyRejectsOnlyThatEntry) {
    std::vector<std::string> lines = {
        "asset=postgresql://db:99999999999/app",
        "completeness=0.5",
        "last_updated=2024-01-01",
        "asset=postgresql://db:5432/app",
        "completeness=0.5",
        "last_updated=2024-01-01",
    };
    std::vector<DocumentationEntry> parsed;
    ASSERT_NO_THROW(parsed = DocumentationIndex::parse(lines, "ports.doc", errors).entries());
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].identity, "net:db:5432");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, WarnCode::InvalidDocumentationEntry);
    EXPECT_EQ(errors[0].line, 1u);
    EXPECT_NE(errors[0].detail.find("invalid port"), std::string::npos);
}

TEST_F(DocumentationIndexTest, MatchesByIdLocatorOrIdentity) {
    DocumentationIndex idx;
    DocumentationEntry by_id;
    by_id.key = "asset-aaaa";
    idx.add(by_id);
    DocumentationEntry by_endpoint;
    by_endpoint.key = "postgresql://app@127.0.0.1/orders";
    idx.add(by_endpoint);

    auto a = asset_with("asset-aaaa", {"/x.db"});
    ASSERT_NE(idx.find(a), nullptr);
    EXPECT_EQ(idx.find(a)->key, "asset-aaaa");

    auto b = asset_with("asset-bbbb", {"localhost:5432"});
    ASSERT_NE(idx.find(b), nullptr);
    EXPECT_EQ(idx.find(b)->key, "postgresql://app@127.0.0.1/orders");

    auto c = asset_with("asset-cccc", {"/other.db"});
    EXPECT_EQ(idx.find(c), nullptr);
}

TEST_F(DocumentationIndexTest, LoadsEveryDocFileInDirectory) {
    fs::path dir = fs::temp_directory_path() / ("asset_scan_docs_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    {
        std::ofstream(dir / "a.doc") << "asset=/a.db\ncompleteness=1\nlast_updated=2024-01-01\n";
        std::ofstream(dir / "b.doc") << "asset=/b.db\ncompleteness=0\nlast_updated=2024-01-01\n";
        std::ofstream(dir / "ignored.txt") << "asset=/c.db\ncompleteness=0\nlast_updated=2024-01-01\n";
    }
    auto idx = DocumentationIndex::load(dir.string(), errors);
    fs::remove_all(dir);
    ASSERT_EQ(idx.entries().size(), 2u);
    EXPECT_EQ(idx.entries()[0].key, "/a.db");
    EXPECT_EQ(idx.entries()[1].key, "/b.db");
}

}

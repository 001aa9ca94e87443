#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "catalog/catalog.hpp"
#include "test_utils.hpp"

using namespace bookcat::catalog;

class CatalogTest : public ::testing::Test {
protected:
  Catalog catalog;

  void SetUp() override {
    init_test_logging();
  }

  // Adds the two example books used by most tests
  void add_dune_books() {
    ASSERT_EQ(catalog.add("Dune", "Herbert", "SciFi"), CatalogStatus::SUCCESS);
    ASSERT_EQ(catalog.add("Dune2", "Herbert", "SciFi"), CatalogStatus::SUCCESS);
  }

  static std::vector<std::string> titles_of(const std::vector<Record>& records) {
    std::vector<std::string> titles;
    for (const auto& record : records) {
      titles.push_back(record.title);
    }
    return titles;
  }
};

TEST_F(CatalogTest, StartsEmpty) {
  EXPECT_TRUE(catalog.empty());
  EXPECT_EQ(catalog.size(), 0u);
  EXPECT_THROW(catalog.at(0), CatalogError);
}

TEST_F(CatalogTest, AddRejectsEmptyTitle) {
  EXPECT_EQ(catalog.add("", "Herbert", "SciFi"), CatalogStatus::EMPTY_TITLE);
  EXPECT_EQ(catalog.add("   \t", "Herbert", "SciFi"), CatalogStatus::EMPTY_TITLE);
  EXPECT_EQ(catalog.size(), 0u);
}

TEST_F(CatalogTest, AddPreservesInsertionOrder) {
  const std::vector<std::string> titles = {"Emma", "Dune", "Beloved", "Dune"};
  for (const auto& title : titles) {
    ASSERT_EQ(catalog.add(title, "", ""), CatalogStatus::SUCCESS);
  }

  ASSERT_EQ(catalog.size(), titles.size());
  EXPECT_EQ(titles_of(catalog.records()), titles);
}

TEST_F(CatalogTest, AddTrimsValues) {
  ASSERT_EQ(catalog.add("  Dune ", " Herbert", "SciFi  "), CatalogStatus::SUCCESS);
  EXPECT_EQ(catalog.at(0), (Record{"Dune", "Herbert", "SciFi"}));
}

TEST_F(CatalogTest, ListAllVisitsOneBasedEntries) {
  std::vector<std::pair<std::size_t, std::string>> seen;
  auto visit = [&seen](std::size_t number, const Record& record) {
    seen.emplace_back(number, record.title);
  };

  EXPECT_FALSE(catalog.list_all(visit));
  EXPECT_TRUE(seen.empty());

  add_dune_books();
  EXPECT_TRUE(catalog.list_all(visit));
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], std::make_pair(std::size_t{1}, std::string("Dune")));
  EXPECT_EQ(seen[1], std::make_pair(std::size_t{2}, std::string("Dune2")));
}

TEST_F(CatalogTest, FindByTitleSubstring) {
  add_dune_books();
  ASSERT_EQ(catalog.add("Emma", "Austen", "Romance"), CatalogStatus::SUCCESS);

  auto matches = catalog.find_by_title_substring("dune");
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].index, 0u);
  EXPECT_EQ(matches[0].record.title, "Dune");
  EXPECT_EQ(matches[1].index, 1u);
  EXPECT_EQ(matches[1].record.title, "Dune2");

  auto emma = catalog.find_by_title_substring("MM");
  ASSERT_EQ(emma.size(), 1u);
  EXPECT_EQ(emma[0].index, 2u);

  // Author is not part of the title match
  EXPECT_TRUE(catalog.find_by_title_substring("austen").empty());
}

TEST_F(CatalogTest, SearchCombinedCoversAllFields) {
  add_dune_books();
  ASSERT_EQ(catalog.add("Emma", "Austen", "Romance"), CatalogStatus::SUCCESS);

  EXPECT_EQ(titles_of(catalog.search_combined("herb")), (std::vector<std::string>{"Dune", "Dune2"}));
  EXPECT_EQ(titles_of(catalog.search_combined("AUSTEN")), (std::vector<std::string>{"Emma"}));
  EXPECT_EQ(titles_of(catalog.search_combined("romance")), (std::vector<std::string>{"Emma"}));
  EXPECT_EQ(titles_of(catalog.search_combined("emma austen")), (std::vector<std::string>{"Emma"}));
  EXPECT_TRUE(catalog.search_combined("tolkien").empty());
}

TEST_F(CatalogTest, SearchByGenreIsCaseInsensitiveSubstring) {
  ASSERT_EQ(catalog.add("The Hobbit", "Tolkien", "Fantasy"), CatalogStatus::SUCCESS);
  ASSERT_EQ(catalog.add("Dune", "Herbert", "SciFi"), CatalogStatus::SUCCESS);

  auto results = catalog.search_by_genre("fan");
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].title, "The Hobbit");

  // Genre search ignores the title
  EXPECT_TRUE(catalog.search_by_genre("hobbit").empty());
}

TEST_F(CatalogTest, MatchingFoldsNonAsciiCase) {
  // "ÉTÉ" by Camus, genre "Roman"
  ASSERT_EQ(catalog.add("\xC3\x89T\xC3\x89", "Camus", "Roman"), CatalogStatus::SUCCESS);
  ASSERT_EQ(catalog.add("Dune", "Herbert", "Science-fiction \xC3\xA9pique"), CatalogStatus::SUCCESS);

  auto matches = catalog.find_by_title_substring("\xC3\xA9t\xC3\xA9");
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].index, 0u);

  EXPECT_EQ(titles_of(catalog.search_combined("\xC3\xA9t\xC3\xA9 camus")), (std::vector<std::string>{"\xC3\x89T\xC3\x89"}));
  EXPECT_EQ(titles_of(catalog.search_by_genre("\xC3\x89PIQUE")), (std::vector<std::string>{"Dune"}));
}

TEST_F(CatalogTest, EditOverwritesField) {
  add_dune_books();

  EXPECT_EQ(catalog.edit(0, "Genre", " Space Opera "), CatalogStatus::SUCCESS);
  EXPECT_EQ(catalog.at(0).genre, "Space Opera");
  EXPECT_EQ(catalog.edit(1, Field::AUTHOR, "F. Herbert"), CatalogStatus::SUCCESS);
  EXPECT_EQ(catalog.at(1).author, "F. Herbert");
  EXPECT_EQ(catalog.edit(1, "Book", "Dune Messiah"), CatalogStatus::SUCCESS);
  EXPECT_EQ(catalog.at(1).title, "Dune Messiah");
}

TEST_F(CatalogTest, EditWithEmptyValueMakesNoChange) {
  add_dune_books();

  EXPECT_EQ(catalog.edit(0, "Genre", ""), CatalogStatus::NO_CHANGE);
  EXPECT_EQ(catalog.edit(0, "Book", "   "), CatalogStatus::NO_CHANGE);
  EXPECT_EQ(catalog.at(0), (Record{"Dune", "Herbert", "SciFi"}));
}

TEST_F(CatalogTest, EditWithUnknownFieldMakesNoChange) {
  add_dune_books();

  EXPECT_EQ(catalog.edit(0, "Publisher", "Chilton"), CatalogStatus::INVALID_FIELD);
  EXPECT_EQ(catalog.edit(0, "genre", "Fantasy"), CatalogStatus::INVALID_FIELD);
  EXPECT_EQ(catalog.at(0), (Record{"Dune", "Herbert", "SciFi"}));
}

TEST_F(CatalogTest, EditOutOfRangeThrows) {
  add_dune_books();
  EXPECT_THROW(catalog.edit(2, "Genre", "Fantasy"), CatalogError);
}

TEST_F(CatalogTest, RemoveRequiresConfirmation) {
  add_dune_books();

  EXPECT_EQ(catalog.remove(0, ""), CatalogStatus::NOT_CONFIRMED);
  EXPECT_EQ(catalog.remove(0, "no"), CatalogStatus::NOT_CONFIRMED);
  EXPECT_EQ(catalog.remove(0, "YESS"), CatalogStatus::NOT_CONFIRMED);
  EXPECT_EQ(catalog.remove(0, "Y"), CatalogStatus::NOT_CONFIRMED);
  EXPECT_EQ(catalog.size(), 2u);
}

TEST_F(CatalogTest, RemoveWithConfirmationDeletesSelectedRecord) {
  add_dune_books();
  ASSERT_EQ(catalog.add("Emma", "Austen", "Romance"), CatalogStatus::SUCCESS);

  EXPECT_EQ(catalog.remove(1, " yes "), CatalogStatus::SUCCESS);
  ASSERT_EQ(catalog.size(), 2u);
  EXPECT_EQ(titles_of(catalog.records()), (std::vector<std::string>{"Dune", "Emma"}));

  EXPECT_THROW(catalog.remove(5, "YES"), CatalogError);
  EXPECT_EQ(catalog.size(), 2u);
}

TEST_F(CatalogTest, DuneWalkthrough) {
  add_dune_books();

  auto matches = catalog.find_by_title_substring("dune");
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].record.title, "Dune");
  EXPECT_EQ(matches[1].record.title, "Dune2");

  EXPECT_EQ(catalog.edit(matches[0].index, "Genre", ""), CatalogStatus::NO_CHANGE);
  EXPECT_EQ(catalog.at(matches[0].index).genre, "SciFi");

  EXPECT_EQ(catalog.remove(matches[0].index, "YES"), CatalogStatus::SUCCESS);
  ASSERT_EQ(catalog.size(), 1u);
  EXPECT_EQ(catalog.at(0), (Record{"Dune2", "Herbert", "SciFi"}));
}

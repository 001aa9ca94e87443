#include "cli/cli.hpp"
#include "utils/text.hpp"
#include <boost/log/trivial.hpp>

namespace bookcat {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(catalog::Catalog& catalog, const catalog::Exporter& exporter,
         std::istream& in, std::ostream& out)
  : running_(false)
  , catalog_(catalog)
  , exporter_(exporter)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  BOOST_LOG_TRIVIAL(info) << "CLI: Starting menu loop";

  while (running_) {
    print_menu();
    auto choice = read_line("\nChoose an option: ");
    if (!choice) {
      break;
    }
    process_choice(*choice);
  }

  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "CLI: Menu loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::print_menu() {
  out_ << "\n=== My Personal Database ===\n"
       << "1. Add new Book\n"
       << "2. View all Books\n"
       << "3. Search Book\n"
       << "4. Edit Book\n"
       << "5. Delete Book\n"
       << "6. Search by Genre\n"
       << "7. Export to file\n"
       << "8. Exit\n";
}

void CLI::process_choice(const std::string& choice) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing menu choice: " << choice;

  if (choice == "1") {
    handle_add_command();
  }
  else if (choice == "2") {
    handle_view_command();
  }
  else if (choice == "3") {
    handle_search_command();
  }
  else if (choice == "4") {
    handle_edit_command();
  }
  else if (choice == "5") {
    handle_delete_command();
  }
  else if (choice == "6") {
    handle_genre_command();
  }
  else if (choice == "7") {
    handle_export_command();
  }
  else if (choice == "8") {
    out_ << "Goodbye!" << std::endl;
    running_ = false;
  }
  else {
    out_ << "Invalid option." << std::endl;
  }
}

void CLI::handle_add_command() {
  auto title = read_line("Enter name of Book: ");
  if (!title) return;
  auto author = read_line("Enter name of Author: ");
  if (!author) return;
  auto genre = read_line("Enter name of Genre: ");
  if (!genre) return;

  if (catalog_.add(*title, *author, *genre) == catalog::CatalogStatus::EMPTY_TITLE) {
    out_ << "Book title cannot be empty." << std::endl;
    return;
  }
  out_ << "Book added successfully!" << std::endl;
}

void CLI::handle_view_command() {
  bool listed = catalog_.list_all([this](std::size_t number, const catalog::Record& record) {
    out_ << "\n--- Book " << number << " ---\n"
         << "Book: " << record.title << "\n"
         << "Author: " << record.author << "\n"
         << "Genre: " << record.genre << "\n";
  });

  if (!listed) {
    out_ << "No books yet!" << std::endl;
  }
}

void CLI::handle_search_command() {
  if (catalog_.empty()) {
    out_ << "No books in the database yet!" << std::endl;
    return;
  }

  auto query = read_line("Search for (title / author / genre): ");
  if (!query) return;

  auto results = catalog_.search_combined(*query);
  for (const auto& record : results) {
    out_ << "- " << record.title << " by " << record.author << " (" << record.genre << ")\n";
  }
  if (results.empty()) {
    out_ << "No items found." << std::endl;
  }
}

void CLI::handle_edit_command() {
  if (catalog_.empty()) {
    out_ << "No books to edit yet!" << std::endl;
    return;
  }

  auto index = select_record("Enter the Book title to edit: ", "\nEnter the number of the book to edit: ");
  if (!index) return;

  const catalog::Record& book = catalog_.at(*index);
  out_ << "\nWhich field do you want to edit?\n";
  for (catalog::Field field : catalog::ALL_FIELDS) {
    out_ << "- " << catalog::field_name(field) << "\n";
  }

  auto field_input = read_line("Enter field name exactly as shown: ");
  if (!field_input) return;

  auto field = catalog::field_from_name(*field_input);
  if (!field) {
    out_ << "Invalid field name." << std::endl;
    return;
  }

  auto new_value = read_line("Enter new value for " + *field_input
    + " (current: " + catalog::field_value(book, *field) + "): ");
  if (!new_value) return;

  switch (catalog_.edit(*index, *field_input, *new_value)) {
    case catalog::CatalogStatus::SUCCESS:
      out_ << "Book updated successfully!" << std::endl;
      break;
    case catalog::CatalogStatus::INVALID_FIELD:
      out_ << "Invalid field name." << std::endl;
      break;
    default:
      out_ << "No change made." << std::endl;
      break;
  }
}

void CLI::handle_delete_command() {
  if (catalog_.empty()) {
    out_ << "No books to delete yet!" << std::endl;
    return;
  }

  auto index = select_record("Enter the title of the Book to delete: ", "\nEnter the number of the book to delete: ");
  if (!index) return;

  auto confirmation = read_line("Type YES to confirm delete '" + catalog_.at(*index).title + "': ");
  if (!confirmation) return;

  if (catalog_.remove(*index, *confirmation) == catalog::CatalogStatus::SUCCESS) {
    out_ << "Book deleted successfully!" << std::endl;
  } else {
    out_ << "Delete cancelled." << std::endl;
  }
}

void CLI::handle_genre_command() {
  if (catalog_.empty()) {
    out_ << "No books in the database yet!" << std::endl;
    return;
  }

  auto query = read_line("Enter the Genre to search for: ");
  if (!query) return;

  out_ << "\nBooks in Genre '" << utils::to_lower(*query) << "':\n";
  auto results = catalog_.search_by_genre(*query);
  for (const auto& record : results) {
    out_ << "- " << record.title << " by " << record.author << "\n";
  }
  if (results.empty()) {
    out_ << "No books found in that Genre." << std::endl;
  }
}

void CLI::handle_export_command() {
  if (catalog_.empty()) {
    out_ << "No books to export yet!" << std::endl;
    return;
  }

  try {
    auto path = exporter_.export_catalog(catalog_);
    out_ << "Export complete: " << path.string() << std::endl;
  } catch (const catalog::ExportError& e) {
    log_and_display_error("Export failed", e.what());
  }
}


//==============================================
// INPUT HELPERS
//==============================================

std::optional<std::string> CLI::read_line(const std::string& prompt) {
  out_ << prompt << std::flush;

  std::string line;
  if (!std::getline(in_, line)) {
    BOOST_LOG_TRIVIAL(info) << "CLI: End of input reached";
    running_ = false;
    out_ << std::endl;
    return std::nullopt;
  }
  return utils::trim(line);
}

std::optional<std::size_t> CLI::select_record(const std::string& title_prompt, const std::string& number_prompt) {
  auto title = read_line(title_prompt);
  if (!title) return std::nullopt;

  auto matches = catalog_.find_by_title_substring(*title);
  if (matches.empty()) {
    out_ << "No books found with that title." << std::endl;
    return std::nullopt;
  }

  out_ << "\nMatching books:\n";
  for (std::size_t i = 0; i < matches.size(); ++i) {
    const auto& record = matches[i].record;
    out_ << i + 1 << ". " << record.title << " by " << record.author << " (" << record.genre << ")\n";
  }

  auto answer = read_line(number_prompt);
  if (!answer) return std::nullopt;

  auto number = utils::parse_integer(*answer);
  if (!number) {
    BOOST_LOG_TRIVIAL(debug) << "CLI: Non-numeric selection: " << *answer;
    out_ << "Please enter a valid number." << std::endl;
    return std::nullopt;
  }

  auto position = utils::to_selection(*number, matches.size());
  if (!position) {
    BOOST_LOG_TRIVIAL(debug) << "CLI: Selection " << *number << " out of range 1-" << matches.size();
    out_ << "Invalid selection." << std::endl;
    return std::nullopt;
  }

  return matches[*position].index;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace bookcat

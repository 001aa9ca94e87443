#pragma once

#include <iostream>
#include <optional>
#include <string>
#include "catalog/catalog.hpp"
#include "catalog/exporter.hpp"

namespace bookcat {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(catalog::Catalog& catalog, const catalog::Exporter& exporter,
      std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Runs the menu loop until "Exit" is chosen or input ends
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  catalog::Catalog& catalog_;
  const catalog::Exporter& exporter_;
  // Console
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void print_menu();
  void process_choice(const std::string& choice);
  void handle_add_command();
  void handle_view_command();
  void handle_search_command();
  void handle_edit_command();
  void handle_delete_command();
  void handle_genre_command();
  void handle_export_command();


  // ---- INPUT HELPERS ----
  // Prints prompt and reads one trimmed line, std::nullopt once input is exhausted
  std::optional<std::string> read_line(const std::string& prompt);
  // Title-based selection used by edit and delete; returns the catalog index
  std::optional<std::size_t> select_record(const std::string& title_prompt, const std::string& number_prompt);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace bookcat

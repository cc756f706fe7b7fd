#pragma once

#include <string>
#include <vector>

enum class category_t {
    Photos,
    Videos,
    Audio,
    Documents,
    Archives,
    Installers,
    Other
};

// media type wins over the extension; unknown inputs are Other
category_t classify_file(const std::string &file_name, const std::string &mime_type = "");

const char *category_name(category_t category);

// every category in folder order, Other last
const std::vector<category_t> &all_categories();

// Photos, Videos and Documents are nested as <year>/<year>-<month>
bool is_date_bucketed(category_t category);

// lowercase text after the last dot, empty when there is none
std::string file_extension(const std::string &file_name);

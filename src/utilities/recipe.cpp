#include "utilities/recipe.hpp"

#include "utilities/blockio.hpp"
#include "utilities/dedup_errors.hpp"
#include "utilities/digest.hpp"
#include "utilities/file_io.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace dedupfs {

namespace {
const char kRecipeSuffix[] = ".recipe";
// Common filesystems reject longer path components.
constexpr std::size_t kMaxFileNameLength = 255;
// Entries whose encoded name does not fit are stored as
// "~<sha256 of name>.recipe" with a "name <encoded>" line before the recipe.
const char kDigestKeyPrefix = '~';
const char kNameField[] = "name ";

bool isPlainNameChar(unsigned char c, bool first) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9') || c == '-' || c == '_') {
    return true;
  }
  // A leading dot would hide the entry or spell "." / "..".
  return c == '.' && !first;
}

std::string percentEncode(const std::string &name) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(name.size());
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto c = static_cast<unsigned char>(name[i]);
    if (isPlainNameChar(c, i == 0)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string percentDecode(const std::string &text) {
  auto nibble = [&](char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    throw std::invalid_argument("Bad escape in recipe name: " + text);
  };
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      throw std::invalid_argument("Truncated escape in recipe name: " + text);
    }
    out.push_back(static_cast<char>((nibble(text[i + 1]) << 4) |
                                    nibble(text[i + 2])));
    i += 2;
  }
  return out;
}

bool isDigestKeyed(const std::string &fileName) {
  const std::size_t suffixLength = sizeof(kRecipeSuffix) - 1;
  return fileName.size() == 1 + utils::DIGEST_HEX_SIZE + suffixLength &&
         fileName[0] == kDigestKeyPrefix &&
         utils::is_valid_hex_digest(
             fileName.substr(1, utils::DIGEST_HEX_SIZE)) &&
         fileName.compare(1 + utils::DIGEST_HEX_SIZE, suffixLength,
                          kRecipeSuffix) == 0;
}

// First line of a digest-keyed entry, newline included.
std::string readNameLine(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::string line;
  if (!std::getline(in, line)) {
    throw RecipeFormatError("cannot read " + path.filename().string());
  }
  return line + "\n";
}

// Splits the "name <encoded>" line off a digest-keyed entry.
std::string takeNameLine(std::string &text) {
  const std::size_t eol = text.find('\n');
  const std::size_t fieldLength = sizeof(kNameField) - 1;
  if (eol == std::string::npos ||
      text.compare(0, fieldLength, kNameField) != 0) {
    throw RecipeFormatError("missing 'name' line");
  }
  std::string name;
  try {
    name = percentDecode(text.substr(fieldLength, eol - fieldLength));
  } catch (const std::invalid_argument &e) {
    throw RecipeFormatError(e.what());
  }
  if (name.empty()) {
    throw RecipeFormatError("empty 'name' line");
  }
  text.erase(0, eol + 1);
  return name;
}

uint64_t parseNumber(const std::string &token, const std::string &what) {
  uint64_t value = 0;
  const char *begin = token.data();
  const char *end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (token.empty() || ec != std::errc() || ptr != end) {
    throw RecipeFormatError("invalid " + what + " '" + token + "'");
  }
  return value;
}

// Reads "<key> <number>" and returns the number.
uint64_t expectField(std::istream &in, const std::string &key) {
  std::string line;
  if (!std::getline(in, line)) {
    throw RecipeFormatError("missing '" + key + "' line");
  }
  std::istringstream fields(line);
  std::string name, value, extra;
  fields >> name >> value;
  if (name != key || (fields >> extra)) {
    throw RecipeFormatError("expected '" + key + " <n>', got '" + line + "'");
  }
  return parseNumber(value, key);
}
} // namespace

uint64_t Recipe::referencedBytes() const {
  uint64_t sum = 0;
  for (const auto &ref : chunks) {
    sum += ref.length;
  }
  return sum;
}

std::vector<std::string> Recipe::digests() const {
  std::vector<std::string> out;
  out.reserve(chunks.size());
  for (const auto &ref : chunks) {
    out.push_back(ref.digest);
  }
  return out;
}

std::string serializeRecipe(const Recipe &recipe) {
  std::ostringstream out;
  out << RECIPE_HEADER << '\n';
  out << "total_size " << recipe.total_size << '\n';
  out << "chunks " << recipe.chunks.size() << '\n';
  for (const auto &ref : recipe.chunks) {
    out << ref.digest << ' ' << ref.length << '\n';
  }
  return out.str();
}

Recipe parseRecipe(const std::string &text) {
  std::istringstream in(text);
  std::string line;
  if (!std::getline(in, line) || line != RECIPE_HEADER) {
    throw RecipeFormatError("missing '" + std::string(RECIPE_HEADER) +
                            "' header");
  }

  Recipe recipe;
  recipe.total_size = expectField(in, "total_size");
  const uint64_t count = expectField(in, "chunks");

  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    std::istringstream fields(line);
    std::string digest, length, extra;
    fields >> digest >> length;
    if (length.empty() || (fields >> extra)) {
      throw RecipeFormatError("bad chunk line '" + line + "'");
    }
    if (!utils::is_valid_hex_digest(digest)) {
      throw RecipeFormatError("bad digest '" + digest + "'");
    }
    recipe.chunks.push_back({digest, parseNumber(length, "chunk length")});
  }

  if (recipe.chunks.size() != count) {
    throw RecipeFormatError("declared " + std::to_string(count) +
                            " chunks, found " +
                            std::to_string(recipe.chunks.size()));
  }
  if (!recipe.isConsistent()) {
    throw RecipeFormatError("chunk lengths sum to " +
                            std::to_string(recipe.referencedBytes()) +
                            ", total_size is " +
                            std::to_string(recipe.total_size));
  }
  return recipe;
}

// ---------------------------------------------------------------------------
// RecipeCatalog
// ---------------------------------------------------------------------------

RecipeCatalog::RecipeCatalog(fs::path dir) : dir_(std::move(dir)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Cannot create recipe directory " +
                                  dir_.string() + ": " + ec.message());
    throw StoreWriteError(dir_.string(), ec.message());
  }
}

std::string RecipeCatalog::encodeName(const std::string &name) {
  if (name.empty()) {
    throw std::invalid_argument("File name must not be empty");
  }
  const std::string encoded = percentEncode(name) + kRecipeSuffix;
  if (encoded.size() <= kMaxFileNameLength) {
    return encoded;
  }
  const auto digest = BlockIO::hash(
      std::span<const std::byte>(reinterpret_cast<const std::byte *>(name.data()),
                                 name.size()),
      utils::HashAlgorithm::SHA256);
  return kDigestKeyPrefix + utils::digest_to_hex(digest) + kRecipeSuffix;
}

std::string RecipeCatalog::decodeName(const std::string &fileName) {
  const std::string suffix(kRecipeSuffix);
  if (fileName.size() <= suffix.size() ||
      fileName.compare(fileName.size() - suffix.size(), suffix.size(),
                       suffix) != 0) {
    throw std::invalid_argument("Not a recipe file: " + fileName);
  }
  if (isDigestKeyed(fileName)) {
    throw std::invalid_argument("Recipe name is stored inside " + fileName);
  }
  const std::string name =
      percentDecode(fileName.substr(0, fileName.size() - suffix.size()));
  // Only the canonical spelling maps back, so no two files share a name.
  if (name.empty() || encodeName(name) != fileName) {
    throw std::invalid_argument("Bad recipe file name: " + fileName);
  }
  return name;
}

fs::path RecipeCatalog::pathFor(const std::string &name) const {
  return dir_ / encodeName(name);
}

void RecipeCatalog::save(const std::string &name, const Recipe &recipe) {
  if (!recipe.isConsistent()) {
    throw CorruptRecipeError(recipe.total_size, recipe.referencedBytes(),
                             "refusing to register inconsistent recipe");
  }
  const fs::path path = pathFor(name);
  std::string text = serializeRecipe(recipe);
  if (isDigestKeyed(path.filename().string())) {
    text = kNameField + percentEncode(name) + "\n" + text;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  utils::atomic_write_file(
      path,
      std::span<const std::byte>(reinterpret_cast<const std::byte *>(text.data()),
                                 text.size()));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Registered recipe for " + name + " (" +
                                std::to_string(recipe.chunks.size()) +
                                " chunks)");
}

std::optional<Recipe> RecipeCatalog::tryLoad(const std::string &name) const {
  const fs::path path = pathFor(name);
  std::vector<std::byte> bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return std::nullopt;
    }
    try {
      bytes = utils::read_file_bytes(path);
    } catch (const std::runtime_error &) {
      // Removed by another process between the check and the read.
      return std::nullopt;
    }
  }
  std::string text(reinterpret_cast<const char *>(bytes.data()),
                   bytes.size());
  try {
    if (isDigestKeyed(path.filename().string()) &&
        takeNameLine(text) != name) {
      throw RecipeFormatError("entry " + path.filename().string() +
                              " belongs to another name");
    }
    return parseRecipe(text);
  } catch (const RecipeFormatError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Recipe for " + name + " unreadable: " +
                                  e.what());
    throw;
  }
}

Recipe RecipeCatalog::load(const std::string &name) const {
  auto recipe = tryLoad(name);
  if (!recipe) {
    throw FileNotFoundError(name);
  }
  return std::move(*recipe);
}

bool RecipeCatalog::exists(const std::string &name) const {
  std::error_code ec;
  return fs::exists(pathFor(name), ec);
}

bool RecipeCatalog::remove(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  const bool removed = fs::remove(pathFor(name), ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR, "Cannot remove recipe for " +
                                                   name + ": " + ec.message());
    throw StoreWriteError(pathFor(name).string(), ec.message());
  }
  return removed;
}

std::vector<std::string> RecipeCatalog::list() const {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file())
      continue;
    const std::string fileName = entry.path().filename().string();
    if (utils::is_temp_file_name(fileName))
      continue;
    try {
      if (isDigestKeyed(fileName)) {
        std::string text = readNameLine(entry.path());
        names.push_back(takeNameLine(text));
      } else {
        names.push_back(decodeName(fileName));
      }
    } catch (const RecipeFormatError &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring unreadable recipe " + fileName +
                                    ": " + e.what());
    } catch (const std::invalid_argument &) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring stray file in recipe directory: " +
                                    fileName);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace dedupfs

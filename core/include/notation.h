#ifndef KSM_NOTATION_H
#define KSM_NOTATION_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.h"
#include "record_codec.h"

namespace ksm::core {

enum class NotationSection : std::uint8_t {
  kType = 0,
  kTitle,
  kNotes,
  kField,
  kCustomField,
  kFile,
};

const char* NotationSectionName(NotationSection section);

// [keeper://]record/section[/name][[index]][[valueKey]]
//
// record and name take the escapes \/ \[ \] and \\. The section is matched
// without regard to case. type, title and notes take no name; field,
// custom_field and file require one. index is digits, or empty for "all
// values"; valueKey requires an index; file takes neither.
class NotationQuery {
 public:
  NotationQuery() = default;

  // Input without any '/' is first tried as url-safe base64 of a notation.
  static bool Parse(std::string_view text, NotationQuery& out, Error& error);

  const std::string& record() const { return record_; }
  NotationSection section() const { return section_; }
  const std::optional<std::string>& name() const { return name_; }
  bool has_index() const { return has_index_; }
  // Empty when the index is "[]".
  const std::optional<std::size_t>& index() const { return index_; }
  const std::optional<std::string>& value_key() const { return value_key_; }

 private:
  std::string record_;
  NotationSection section_{NotationSection::kNotes};
  std::optional<std::string> name_;
  bool has_index_{false};
  std::optional<std::size_t> index_;
  std::optional<std::string> value_key_;

  friend class NotationParser;
};

// Uid first, then exact title. Several title matches are kAmbiguousTitle,
// none is kRecordNotFound.
bool FindNotationRecord(const RecordGraph& graph, const std::string& selector,
                        const KeeperRecord*& out, Error& error);

// Downloads and decrypts a file attachment.
using FileFetcher = std::function<bool(const KeeperFile& file,
                                       std::vector<std::uint8_t>& out_plain,
                                       Error& error)>;

// out is nullopt when the addressed value does not exist. Without an index
// every value of the field is returned. Non-string values are returned as
// compact JSON. file values are the url-safe base64 of the content.
bool ResolveNotation(const RecordGraph& graph, const NotationQuery& query,
                     const FileFetcher& fetch_file,
                     std::optional<std::vector<std::string>>& out,
                     Error& error);

// Absent values become kMissingField.
bool ResolveRequired(const RecordGraph& graph, const NotationQuery& query,
                     const FileFetcher& fetch_file,
                     std::vector<std::string>& out, Error& error);

// Writes value into a field or custom_field addressed by query. Without an
// index the field's values are replaced by [value].
bool SetNotationValue(RecordGraph& graph, const NotationQuery& query,
                      const std::string& value, Error& error);

}  // namespace ksm::core

#endif  // KSM_NOTATION_H

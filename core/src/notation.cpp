#include "notation.h"

#include <cctype>
#include <utility>

#include "encoding_utils.h"

namespace ksm::core {

namespace {

constexpr char kPrefix[] = "keeper://";

struct SectionName {
  const char* text;
  NotationSection section;
  bool takes_name;
};

constexpr SectionName kSections[] = {
    {"type", NotationSection::kType, false},
    {"title", NotationSection::kTitle, false},
    {"notes", NotationSection::kNotes, false},
    {"field", NotationSection::kField, true},
    {"custom_field", NotationSection::kCustomField, true},
    {"file", NotationSection::kFile, true},
};

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool IsEscapable(char ch) {
  return ch == '/' || ch == '[' || ch == ']' || ch == '\\';
}

std::string ValueToString(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

FieldSection ToFieldSection(NotationSection section) {
  return section == NotationSection::kCustomField ? FieldSection::kCustom
                                                  : FieldSection::kStandard;
}

}  // namespace

// One pass over the input, one state per grammar element.
class NotationParser {
 public:
  NotationParser(std::string_view text, Error& error)
      : text_(text), error_(error) {}

  bool Run(NotationQuery& out) {
    if (text_.size() >= sizeof(kPrefix) - 1 &&
        EqualsIgnoreCase(text_.substr(0, sizeof(kPrefix) - 1), kPrefix)) {
      pos_ = sizeof(kPrefix) - 1;
    }
    NotationQuery query;
    if (!ReadEscaped(query.record_, '/', "record")) return false;
    if (AtEnd()) return Invalid(pos_, "missing section");
    ++pos_;  // '/'

    const std::size_t section_start = pos_;
    while (!AtEnd() && text_[pos_] != '/' && text_[pos_] != '[') ++pos_;
    const std::string_view section_text =
        text_.substr(section_start, pos_ - section_start);
    const SectionName* section = nullptr;
    for (const auto& candidate : kSections) {
      if (EqualsIgnoreCase(section_text, candidate.text)) {
        section = &candidate;
        break;
      }
    }
    if (!section) return Invalid(section_start, "unknown section");
    query.section_ = section->section;

    if (!section->takes_name) {
      if (!AtEnd() && text_[pos_] == '/') {
        return Fail(error_, ErrorCode::kUnexpectedName,
                    std::string(section->text) + " takes no name (offset " +
                        std::to_string(pos_) + ")");
      }
      if (!AtEnd()) return Invalid(pos_, "unexpected character");
      out = std::move(query);
      return true;
    }

    if (AtEnd() || text_[pos_] != '/') {
      return Invalid(pos_, std::string(section->text) + " requires a name");
    }
    ++pos_;
    std::string name;
    if (!ReadEscaped(name, '[', "name")) return false;
    query.name_ = std::move(name);

    if (section->section == NotationSection::kFile) {
      if (!AtEnd()) return Invalid(pos_, "file takes no index");
      out = std::move(query);
      return true;
    }

    if (!AtEnd()) {
      std::string index_text;
      const std::size_t index_start = pos_ + 1;
      if (!ReadBracket(index_text)) return false;
      query.has_index_ = true;
      if (!index_text.empty()) {
        std::size_t value = 0;
        for (std::size_t i = 0; i < index_text.size(); ++i) {
          const char ch = index_text[i];
          if (ch < '0' || ch > '9') {
            return Invalid(index_start + i, "index must be digits");
          }
          if (value > (static_cast<std::size_t>(-1) - 9) / 10) {
            return Invalid(index_start + i, "index too large");
          }
          value = value * 10 + static_cast<std::size_t>(ch - '0');
        }
        query.index_ = value;
      }
    }
    if (!AtEnd()) {
      std::string key;
      if (!ReadBracket(key)) return false;
      if (!key.empty()) query.value_key_ = std::move(key);
    }
    if (!AtEnd()) return Invalid(pos_, "unexpected character");
    out = std::move(query);
    return true;
  }

 private:
  bool AtEnd() const { return pos_ >= text_.size(); }

  bool Invalid(std::size_t offset, const std::string& reason) {
    return Fail(error_, ErrorCode::kInvalidNotation,
                "invalid notation at offset " + std::to_string(offset) + ": " +
                    reason);
  }

  // Reads until an unescaped stop character or the end. A bare '/' inside
  // a name, or a stray ']', is rejected.
  bool ReadEscaped(std::string& out, char stop, const char* what) {
    const std::size_t start = pos_;
    while (!AtEnd()) {
      const char ch = text_[pos_];
      if (ch == '\\') {
        if (pos_ + 1 >= text_.size() || !IsEscapable(text_[pos_ + 1])) {
          return Invalid(pos_, "bad escape");
        }
        out.push_back(text_[pos_ + 1]);
        pos_ += 2;
        continue;
      }
      if (ch == stop) break;
      if (stop == '[' && (ch == '/' || ch == ']')) {
        return Invalid(pos_, std::string("unescaped '") + ch + "' in name");
      }
      out.push_back(ch);
      ++pos_;
    }
    if (pos_ == start) return Invalid(start, std::string(what) + " is empty");
    return true;
  }

  bool ReadBracket(std::string& out) {
    if (text_[pos_] != '[') return Invalid(pos_, "expected '['");
    ++pos_;
    while (!AtEnd() && text_[pos_] != ']') {
      if (text_[pos_] == '[') return Invalid(pos_, "nested '['");
      out.push_back(text_[pos_]);
      ++pos_;
    }
    if (AtEnd()) return Invalid(pos_, "missing ']'");
    ++pos_;
    return true;
  }

  std::string_view text_;
  Error& error_;
  std::size_t pos_{0};
};

bool FindNotationRecord(const RecordGraph& graph, const std::string& selector,
                        const KeeperRecord*& out, Error& error) {
  out = graph.FindRecord(selector);
  if (out) {
    return true;
  }
  const auto matches = graph.FindRecordsByTitle(selector);
  if (matches.size() > 1) {
    return Fail(error, ErrorCode::kAmbiguousTitle,
                std::to_string(matches.size()) + " records titled '" +
                    selector + "'");
  }
  if (matches.empty()) {
    return Fail(error, ErrorCode::kRecordNotFound,
                "record '" + selector + "' not found");
  }
  out = matches.front();
  return true;
}

const char* NotationSectionName(NotationSection section) {
  for (const auto& candidate : kSections) {
    if (candidate.section == section) return candidate.text;
  }
  return "unknown";
}

bool NotationQuery::Parse(std::string_view text, NotationQuery& out,
                          Error& error) {
  if (text.find('/') == std::string_view::npos) {
    std::vector<std::uint8_t> decoded;
    if (!text.empty() && common::Base64Decode(text, decoded)) {
      const std::string inner = common::BytesToString(decoded);
      if (inner.find('/') != std::string::npos) {
        return NotationParser(inner, error).Run(out);
      }
    }
    return Fail(error, ErrorCode::kInvalidNotation,
                "invalid notation at offset " + std::to_string(text.size()) +
                    ": missing section");
  }
  return NotationParser(text, error).Run(out);
}

bool ResolveNotation(const RecordGraph& graph, const NotationQuery& query,
                     const FileFetcher& fetch_file,
                     std::optional<std::vector<std::string>>& out,
                     Error& error) {
  out.reset();
  const KeeperRecord* record = nullptr;
  if (!FindNotationRecord(graph, query.record(), record, error)) {
    return false;
  }

  switch (query.section()) {
    case NotationSection::kType:
    case NotationSection::kTitle: {
      const char* key =
          query.section() == NotationSection::kType ? "type" : "title";
      const auto it = record->data.find(key);
      if (it != record->data.end() && it->is_string()) {
        out = std::vector<std::string>{it->get<std::string>()};
      }
      return true;
    }
    case NotationSection::kNotes: {
      auto notes = record->Notes();
      if (notes) out = std::vector<std::string>{std::move(*notes)};
      return true;
    }
    case NotationSection::kFile: {
      const KeeperFile* file = record->FindFile(*query.name());
      if (!file) return true;
      if (!fetch_file) {
        return Fail(error, ErrorCode::kInvalidArgument,
                    "no file fetcher for file notation");
      }
      std::vector<std::uint8_t> content;
      common::ScopedWipe wipe_content(content);
      if (!fetch_file(*file, content, error)) {
        return false;
      }
      out = std::vector<std::string>{common::Base64UrlEncode(content)};
      return true;
    }
    case NotationSection::kField:
    case NotationSection::kCustomField:
      break;
  }

  auto values =
      record->FieldValues(ToFieldSection(query.section()), *query.name());
  if (!values) return true;
  if (query.index()) {
    if (*query.index() >= values->size()) return true;
    nlohmann::json picked = std::move((*values)[*query.index()]);
    values->assign(1, std::move(picked));
  }

  std::vector<std::string> result;
  result.reserve(values->size());
  for (const auto& value : *values) {
    if (!query.value_key()) {
      result.push_back(ValueToString(value));
      continue;
    }
    if (!value.is_object()) continue;
    const auto it = value.find(*query.value_key());
    if (it == value.end()) continue;
    result.push_back(ValueToString(*it));
  }
  if (query.value_key() && result.empty()) return true;
  out = std::move(result);
  return true;
}

bool ResolveRequired(const RecordGraph& graph, const NotationQuery& query,
                     const FileFetcher& fetch_file,
                     std::vector<std::string>& out, Error& error) {
  std::optional<std::vector<std::string>> resolved;
  if (!ResolveNotation(graph, query, fetch_file, resolved, error)) {
    return false;
  }
  if (!resolved) {
    return Fail(error, ErrorCode::kMissingField,
                std::string(NotationSectionName(query.section())) +
                    (query.name() ? " '" + *query.name() + "'" : "") +
                    " has no value in record '" + query.record() + "'");
  }
  out = std::move(*resolved);
  return true;
}

bool SetNotationValue(RecordGraph& graph, const NotationQuery& query,
                      const std::string& value, Error& error) {
  if (query.section() != NotationSection::kField &&
      query.section() != NotationSection::kCustomField) {
    return Fail(error, ErrorCode::kInvalidArgument,
                std::string("cannot set ") +
                    NotationSectionName(query.section()) + " by notation");
  }
  const KeeperRecord* found = nullptr;
  if (!FindNotationRecord(graph, query.record(), found, error)) {
    return false;
  }
  KeeperRecord* record = graph.FindRecord(found->uid);
  const FieldSection section = ToFieldSection(query.section());
  auto values = record->FieldValues(section, *query.name());
  if (!values) {
    return Fail(error, ErrorCode::kMissingField,
                "field '" + *query.name() + "' not found in record " +
                    record->uid);
  }

  if (!query.index()) {
    if (query.value_key()) {
      return Fail(error, ErrorCode::kInvalidArgument,
                  "a value key needs an explicit index");
    }
    values->assign(1, nlohmann::json(value));
    return record->SetFieldValue(section, *query.name(), *values, error);
  }
  const std::size_t index = *query.index();
  if (index >= values->size()) {
    return Fail(error, ErrorCode::kMissingField,
                "index " + std::to_string(index) + " out of range for '" +
                    *query.name() + "'");
  }
  if (!query.value_key()) {
    (*values)[index] = value;
  } else {
    auto& target = (*values)[index];
    if (!target.is_object()) {
      return Fail(error, ErrorCode::kInvalidArgument,
                  "value at index " + std::to_string(index) +
                      " is not an object");
    }
    target[*query.value_key()] = value;
  }
  return record->SetFieldValue(section, *query.name(), *values, error);
}

}  // namespace ksm::core

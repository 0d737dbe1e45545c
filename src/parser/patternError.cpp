#include "parser/patternError.hpp"

namespace regen {

static std::string describeError(const std::string &kind,
                                 const std::string &message,
                                 const SourceLocation &location) {
  std::string where;
  if (location.line > 1) {
    where = " at line " + std::to_string(location.line) + ", column " +
            std::to_string(location.column);
  } else {
    where = " at column " + std::to_string(location.column);
  }
  return kind + where + ": " + message;
}

PatternError::PatternError(const std::string &kind, const std::string &message,
                           SourceLocation location, std::string construct)
    : std::runtime_error(describeError(kind, message, location)),
      message_(message), location_(location), construct_(std::move(construct)) {
}

std::string PatternError::render(const std::string &source) const {
  size_t lineStart = 0;
  size_t offset = location_.offset < source.size() ? location_.offset
                                                   : source.size();
  size_t previousBreak = source.rfind('\n', offset == 0 ? 0 : offset - 1);
  if (previousBreak != std::string::npos && previousBreak < offset) {
    lineStart = previousBreak + 1;
  }
  size_t lineEnd = source.find('\n', offset);
  if (lineEnd == std::string::npos) {
    lineEnd = source.size();
  }

  std::string caretLine(offset - lineStart, ' ');
  for (size_t i = lineStart; i < offset; i++) {
    // keep tabs so the caret lines up under tab-indented text
    if (source[i] == '\t') {
      caretLine[i - lineStart] = '\t';
    }
  }

  return std::string(what()) + "\n  " +
         source.substr(lineStart, lineEnd - lineStart) + "\n  " + caretLine +
         "^";
}

} // namespace regen

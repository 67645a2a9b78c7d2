#include <edge_agent/prompt/intent.hpp>

#include <edge_agent/core/text.hpp>

#include <algorithm>

namespace edge_agent {

namespace {

// Keywords that signal a write on their own.
constexpr std::string_view kStrongKeywords[] = {
    "作成", "作って", "作る", "つくって", "つくる",
    "書き込", "書いて", "書く", "かいて",
    "保存", "ほぞん",
    "生成", "せいせい",
    "出力し", "出力ファイル",
    "create", "write", "save", "generate",
    "make a file", "make file",
};

constexpr std::string_view kFileOperationPhrases[] = {
    "ファイルに", "ファイルを作", "ファイルを書", "ファイルを生成", "ファイルを出力",
    "file to", "file and", "to file", "in file", "into file",
    "create file", "write file", "save file", "output file", "generate file",
};

} // anonymous namespace

bool HasFileOperationIntent(std::string_view text) {
    const auto lower = ToLowerAscii(text);
    auto contains = [&](std::string_view needle) {
        return lower.find(needle) != std::string::npos;
    };
    return std::any_of(std::begin(kStrongKeywords), std::end(kStrongKeywords), contains) ||
           std::any_of(std::begin(kFileOperationPhrases), std::end(kFileOperationPhrases),
                       contains);
}

} // namespace edge_agent

#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * Mints human-pronounceable rendezvous codes such as "otter-lynx-robin".
 */
class CodeGenerator {
public:
    /// Uses the built-in animal word list.
    explicit CodeGenerator(std::size_t words_per_code = 3);
    CodeGenerator(std::vector<std::string> words, std::size_t words_per_code);

    /// Distinct words drawn with the libsodium CSPRNG, joined by '-'.
    [[nodiscard]] std::string generate() const;

    [[nodiscard]] const std::vector<std::string>& words() const { return words_; }

    static const std::vector<std::string>& default_words();

private:
    std::vector<std::string> words_;
    std::size_t words_per_code_;
};

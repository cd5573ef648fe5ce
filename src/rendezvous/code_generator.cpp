/**
 * CodeGenerator: random indices into a word list, no word repeated.
 */

#include "rendezvous/code_generator.h"

#include <stdexcept>
#include <utility>

#include "crypto/random.h"

CodeGenerator::CodeGenerator(std::size_t words_per_code)
    : CodeGenerator(default_words(), words_per_code) {}

CodeGenerator::CodeGenerator(std::vector<std::string> words, std::size_t words_per_code)
    : words_(std::move(words)), words_per_code_(words_per_code) {
    if (words_per_code_ == 0 || words_per_code_ > words_.size()) {
        throw std::invalid_argument("word list too short for the requested code length");
    }
}

std::string CodeGenerator::generate() const {
    // Partial Fisher-Yates over an index list keeps the picks distinct.
    std::vector<std::size_t> indices(words_.size());
    for (std::size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }

    std::string code;
    for (std::size_t i = 0; i < words_per_code_; ++i) {
        auto remaining = static_cast<uint32_t>(indices.size() - i);
        std::size_t pick = i + CryptoRandom::uniform(remaining);
        std::swap(indices[i], indices[pick]);

        if (!code.empty()) {
            code += '-';
        }
        code += words_[indices[i]];
    }
    return code;
}

const std::vector<std::string>& CodeGenerator::default_words() {
    static const std::vector<std::string> animals = {
        "aardvark", "aardwolf", "anteater", "antelope", "ape", "armadillo", "badger",
        "bat", "bear", "beaver", "bison", "bluejay", "bobcat", "buffalo", "cardinal",
        "caribou", "cat", "cheetah", "chicken", "chimpanzee", "chipmunk", "cougar",
        "cow", "crow", "deer", "dingo", "dog", "duck", "eagle", "elephant", "falcon",
        "ferret", "fox", "gazelle", "giraffe", "goat", "goose", "gorilla", "hawk",
        "hedgehog", "horse", "hummingbird", "hyena", "ibex", "jaguar", "jay",
        "kangaroo", "koala", "lemur", "leopard", "lion", "lynx", "magpie", "meerkat",
        "mink", "mongoose", "monkey", "moose", "muskox", "opossum", "orangutan",
        "ostrich", "otter", "owl", "panda", "pangolin", "panther", "parrot", "peacock",
        "penguin", "pig", "platypus", "porcupine", "rabbit", "raccoon", "raven",
        "reindeer", "robin", "sheep", "skunk", "sloth", "sparrow", "squirrel", "stoat",
        "swan", "tiger", "turkey", "wallaby", "weasel", "wolf", "wolverine", "wombat",
        "woodpecker", "yak", "zebra",
    };
    return animals;
}

#ifndef SEQUENCE_GENERATOR_HPP
#define SEQUENCE_GENERATOR_HPP

#include <string>
#include <vector>
#include <random>
#include <cstdint>

// Symbol codes are part of the host protocol: the host forwards these integers.
enum class ArrowDirection {
    LEFT = 0,
    UP = 1,
    RIGHT = 2
};

using ArrowSequence = std::vector<ArrowDirection>;

// Number of arrows in every challenge
constexpr int SEQUENCE_LENGTH = 6;
constexpr int NUM_DIRECTIONS = 3;

std::string directionToString(ArrowDirection dir);
ArrowDirection stringToDirection(const std::string& str);

// True for the symbols 0, 1 and 2
bool isValidSymbol(int64_t symbol);

// "021102"-style digit string, one digit per arrow
std::string sequenceToString(const ArrowSequence& sequence);

// Inverse of sequenceToString. Throws InvalidArgument on a wrong length or digit.
ArrowSequence sequenceFromString(const std::string& digits);

class SequenceGenerator {
public:
    SequenceGenerator();
    explicit SequenceGenerator(uint32_t seed);
    ~SequenceGenerator() = default;

    // Draw a fresh answer from the generator's own engine
    ArrowSequence generateSequence();

    // Draw a fresh answer from a caller supplied engine
    static ArrowSequence generateSequence(std::mt19937& engine);

private:
    std::mt19937 rng;
};

#endif // SEQUENCE_GENERATOR_HPP

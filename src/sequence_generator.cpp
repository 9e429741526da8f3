#include "sequence_generator.hpp"
#include "captcha_errors.hpp"

namespace {

constexpr ArrowDirection DIRECTIONS[] = {
    ArrowDirection::LEFT,
    ArrowDirection::UP,
    ArrowDirection::RIGHT
};

} // namespace

std::string directionToString(ArrowDirection dir) {
    switch (dir) {
        case ArrowDirection::LEFT: return "left";
        case ArrowDirection::UP: return "up";
        case ArrowDirection::RIGHT: return "right";
        default: return "unknown";
    }
}

ArrowDirection stringToDirection(const std::string& str) {
    if (str == "left") return ArrowDirection::LEFT;
    if (str == "up") return ArrowDirection::UP;
    if (str == "right") return ArrowDirection::RIGHT;
    throw InvalidArgument("Unknown arrow direction: " + str);
}

bool isValidSymbol(int64_t symbol) {
    return symbol >= 0 && symbol < NUM_DIRECTIONS;
}

std::string sequenceToString(const ArrowSequence& sequence) {
    std::string digits;
    digits.reserve(sequence.size());
    for (const auto& dir : sequence) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(dir)));
    }
    return digits;
}

ArrowSequence sequenceFromString(const std::string& digits) {
    if (static_cast<int>(digits.size()) != SEQUENCE_LENGTH) {
        throw InvalidArgument("Sequence must have exactly " + std::to_string(SEQUENCE_LENGTH) +
                              " symbols, got " + std::to_string(digits.size()));
    }

    ArrowSequence sequence;
    sequence.reserve(digits.size());
    for (char c : digits) {
        int symbol = c - '0';
        if (!isValidSymbol(symbol)) {
            throw InvalidArgument(std::string("Invalid sequence symbol: ") + c);
        }
        sequence.push_back(static_cast<ArrowDirection>(symbol));
    }
    return sequence;
}

SequenceGenerator::SequenceGenerator()
    : rng(std::random_device{}()) {
}

SequenceGenerator::SequenceGenerator(uint32_t seed)
    : rng(seed) {
}

ArrowSequence SequenceGenerator::generateSequence() {
    return generateSequence(rng);
}

ArrowSequence SequenceGenerator::generateSequence(std::mt19937& engine) {
    // Independent draws, repeats allowed: 3^6 possible answers
    std::uniform_int_distribution<int> direction_dist(0, NUM_DIRECTIONS - 1);

    ArrowSequence sequence;
    sequence.reserve(SEQUENCE_LENGTH);
    for (int i = 0; i < SEQUENCE_LENGTH; ++i) {
        sequence.push_back(DIRECTIONS[direction_dist(engine)]);
    }
    return sequence;
}

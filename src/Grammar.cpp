/**
 * @file Grammar.cpp
 * @brief Grammar description, the linear numeral scanner and the pattern cache
 */

#include "numeral/Grammar.hpp"

#include <algorithm>
#include <cstring>
#include <list>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace numeral {

namespace {

/**
 * @brief Escape @p c for use as a literal inside an ECMAScript regex
 */
std::string escape(char c) {
    static const char* const special = "^$\\.*+?()[]{}|";
    if (c != '\0' && std::strchr(special, c) != nullptr) {
        return std::string("\\") + c;
    }
    return std::string(1, c);
}

/**
 * @brief Quantifier for lo..hi repetitions ("" for exactly one)
 */
std::string repeat(std::size_t lo, std::size_t hi) {
    if (hi == unbounded) {
        if (lo == 0) return "*";
        if (lo == 1) return "+";
        return "{" + std::to_string(lo) + ",}";
    }
    if (lo == hi) {
        return lo == 1 ? "" : "{" + std::to_string(lo) + "}";
    }
    return "{" + std::to_string(lo) + "," + std::to_string(hi) + "}";
}

std::string sign_grammar(SignPolicy policy) {
    switch (policy) {
        case SignPolicy::Forbidden: return "()";
        case SignPolicy::MinusOptional: return "(-?)";
        case SignPolicy::MandatoryPlusOrMinus: return "([+-])";
        case SignPolicy::PlusMinusOptional: return "([+-]?)";
    }
    return "()";
}

std::string plain_integer(std::size_t lo, std::size_t hi) {
    std::string body = "[1-9]";
    if (hi != 1) {
        body += "\\d" + repeat(lo - 1, hi == unbounded ? unbounded : hi - 1);
    }
    return body + "|0";
}

/**
 * @brief Leading group of 3, 2 or 1 digits followed by separator groups
 *
 * The group count of each alternative keeps the digit total in [lo, hi].
 */
std::string grouped_integer(std::size_t lo, std::size_t hi, char sep) {
    std::vector<std::string> alternatives;
    for (std::size_t lead = 3; lead >= 1; --lead) {
        if (hi != unbounded && hi < lead) continue;

        const std::size_t kmin = lo > lead ? (lo - lead + 2) / 3 : 0;
        const std::size_t kmax = hi == unbounded ? unbounded : (hi - lead) / 3;
        if (kmax != unbounded && kmin > kmax) continue;

        std::string alt = "[1-9]";
        if (lead > 1) alt += "\\d" + repeat(lead - 1, lead - 1);
        if (kmax != 0) {
            alt += "(?:" + escape(sep) + "\\d{3})" + (kmin == 0 && kmax == 1 ? "?" : repeat(kmin, kmax));
        }
        alternatives.push_back(alt);
    }
    alternatives.push_back("0");

    std::string out;
    for (std::size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) out += "|";
        out += alternatives[i];
    }
    return out;
}

std::string integer_grammar(const NumberFormatOptions& o) {
    switch (o.scientific_notation()) {
        case ScientificNotation::Normalized: return "([1-9]|0)";
        case ScientificNotation::StrictNormalized: return "([1-9])";
        case ScientificNotation::Engineering: return "([1-9]\\d{0,2}|0)";
        case ScientificNotation::None: break;
    }

    if (o.is_fractional_only()) {
        return "(0?)";
    }

    const std::size_t lo = std::max<std::size_t>(o.min_integer_part_digits(), 1);
    const std::size_t hi = o.max_integer_part_digits();
    const std::string body = o.thousand_separator()
        ? grouped_integer(lo, hi, *o.thousand_separator())
        : plain_integer(lo, hi);

    if (o.min_integer_part_digits() == 0) {
        return "((?:" + body + ")?)";
    }
    return "(" + body + ")";
}

std::string fractional_grammar(const NumberFormatOptions& o) {
    if (!o.allows_fraction()) {
        return "()";
    }
    const std::size_t lo = std::max<std::size_t>(o.min_fractional_digits(), 1);
    std::string out = "(?:" + escape(o.fractional_separator()) +
                      "(\\d" + repeat(lo, o.max_fractional_digits()) + "))";
    if (o.min_fractional_digits() == 0) out += "?";
    return out;
}

std::string exponent_grammar(const NumberFormatOptions& o) {
    const char letter = o.exponent_letter();
    if (letter == '\0') {
        return "()";
    }
    return "(?:" + escape(letter) + "([+-]?\\d+))?";
}

} // namespace

std::string grammar_source(const NumberFormatOptions& options) {
    return sign_grammar(options.sign_policy()) +
           integer_grammar(options) +
           fractional_grammar(options) +
           exponent_grammar(options);
}

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_nonzero_digit(char c) {
    return c >= '1' && c <= '9';
}

/**
 * @brief Forward cursor over the input, one pass, no backtracking
 */
class Scanner {
public:
    explicit Scanner(std::string_view input) : input_(input) {}

    std::size_t pos() const { return pos_; }
    void reset(std::size_t pos) { pos_ = pos; }

    bool at(char c) const { return pos_ < input_.size() && input_[pos_] == c; }
    bool at_digit() const { return pos_ < input_.size() && is_digit(input_[pos_]); }
    bool at_nonzero_digit() const { return pos_ < input_.size() && is_nonzero_digit(input_[pos_]); }

    bool take(char c) {
        if (!at(c)) return false;
        ++pos_;
        return true;
    }

    /// Consume up to @p most digits and return how many were taken
    std::size_t take_digits(std::size_t most) {
        std::size_t n = 0;
        while (n < most && at_digit()) {
            ++pos_;
            ++n;
        }
        return n;
    }

    std::size_t count_digits_at(std::size_t from, std::size_t most) const {
        std::size_t n = 0;
        while (n < most && from + n < input_.size() && is_digit(input_[from + n])) ++n;
        return n;
    }

    std::string slice(std::size_t from) const {
        return std::string(input_.substr(from, pos_ - from));
    }

private:
    std::string_view input_;
    std::size_t pos_ = 0;
};

std::size_t minus_one(std::size_t n) {
    return n == unbounded ? unbounded : n - 1;
}

bool scan_sign(Scanner& s, SignPolicy policy) {
    switch (policy) {
        case SignPolicy::Forbidden: return true;
        case SignPolicy::MinusOptional:
            s.take('-');
            return true;
        case SignPolicy::MandatoryPlusOrMinus:
            return s.take('+') || s.take('-');
        case SignPolicy::PlusMinusOptional:
            if (!s.take('+')) s.take('-');
            return true;
    }
    return false;
}

/// [1-9] then digits up to @p hi in total, at least @p lo; otherwise a lone 0
bool scan_plain_integer(Scanner& s, std::size_t lo, std::size_t hi) {
    const std::size_t start = s.pos();
    if (s.at_nonzero_digit()) {
        s.take_digits(1);
        const std::size_t rest = s.take_digits(minus_one(hi));
        if (1 + rest >= lo) return true;
        s.reset(start);
    }
    return s.take('0');
}

/// Leading group of 3, 2 or 1 digits, each tried in turn, then greedy groups
bool scan_grouped_integer(Scanner& s, std::size_t lo, std::size_t hi, char sep) {
    const std::size_t start = s.pos();
    for (std::size_t lead = 3; lead >= 1; --lead) {
        if (hi != unbounded && hi < lead) continue;

        const std::size_t kmin = lo > lead ? (lo - lead + 2) / 3 : 0;
        const std::size_t kmax = hi == unbounded ? unbounded : (hi - lead) / 3;
        if (kmax != unbounded && kmin > kmax) continue;

        s.reset(start);
        if (!s.at_nonzero_digit() || s.count_digits_at(start, lead) != lead) continue;
        s.take_digits(lead);

        std::size_t groups = 0;
        while (groups < kmax && s.at(sep) && s.count_digits_at(s.pos() + 1, 3) == 3) {
            s.take(sep);
            s.take_digits(3);
            ++groups;
        }
        if (groups >= kmin) return true;
    }
    s.reset(start);
    return s.take('0');
}

bool scan_integer(Scanner& s, const NumberFormatOptions& o) {
    switch (o.scientific_notation()) {
        case ScientificNotation::Normalized:
            return s.take_digits(1) == 1;
        case ScientificNotation::StrictNormalized:
            return s.at_nonzero_digit() && s.take_digits(1) == 1;
        case ScientificNotation::Engineering:
            if (s.at_nonzero_digit()) {
                s.take_digits(3);
                return true;
            }
            return s.take('0');
        case ScientificNotation::None:
            break;
    }

    if (o.is_fractional_only()) {
        s.take('0');
        return true;
    }

    const std::size_t lo = std::max<std::size_t>(o.min_integer_part_digits(), 1);
    const std::size_t hi = o.max_integer_part_digits();
    const bool found = o.thousand_separator()
        ? scan_grouped_integer(s, lo, hi, *o.thousand_separator())
        : scan_plain_integer(s, lo, hi);

    return found || o.min_integer_part_digits() == 0;
}

bool scan_fraction(Scanner& s, const NumberFormatOptions& o, std::string& digits) {
    if (!o.allows_fraction()) {
        return true;
    }
    const std::size_t lo = std::max<std::size_t>(o.min_fractional_digits(), 1);
    if (s.at(o.fractional_separator()) &&
        s.count_digits_at(s.pos() + 1, o.max_fractional_digits()) >= lo) {
        s.take(o.fractional_separator());
        const std::size_t from = s.pos();
        s.take_digits(o.max_fractional_digits());
        digits = s.slice(from);
        return true;
    }
    return o.min_fractional_digits() == 0;
}

void scan_exponent(Scanner& s, const NumberFormatOptions& o, std::string& exponent) {
    const char letter = o.exponent_letter();
    if (letter == '\0' || !s.at(letter)) {
        return;
    }
    const std::size_t mark = s.pos();
    s.take(letter);
    const std::size_t from = s.pos();
    if (!s.take('+')) s.take('-');
    if (s.take_digits(unbounded) == 0) {
        s.reset(mark);
        return;
    }
    exponent = s.slice(from);
}

} // namespace

Pattern::Pattern(const NumberFormatOptions& options)
    : options_(options)
    , source_(grammar_source(options))
{}

std::optional<PatternMatch> Pattern::accept(PatternMatch m) const {
    // A sign or an exponent alone is not a numeral
    if (m.integer_part.empty() && m.fractional_part.empty()) {
        return std::nullopt;
    }
    // Only zero itself may have a zero mantissa
    const ScientificNotation notation = options_.scientific_notation();
    if ((notation == ScientificNotation::Normalized || notation == ScientificNotation::Engineering) &&
        m.integer_part == "0" &&
        m.fractional_part.find_first_not_of('0') != std::string::npos) {
        return std::nullopt;
    }
    return m;
}

std::optional<PatternMatch> Pattern::match_prefix(std::string_view input) const {
    if (input.empty()) {
        return std::nullopt;
    }

    Scanner s(input);
    PatternMatch m;

    if (!scan_sign(s, options_.sign_policy())) {
        return std::nullopt;
    }
    m.sign = s.slice(0);

    const std::size_t integer_start = s.pos();
    if (!scan_integer(s, options_)) {
        return std::nullopt;
    }
    m.integer_part = s.slice(integer_start);

    if (!scan_fraction(s, options_, m.fractional_part)) {
        return std::nullopt;
    }
    scan_exponent(s, options_, m.exponent);

    m.end = s.pos();
    m.matched = std::string(input.substr(0, m.end));
    return accept(std::move(m));
}

bool Pattern::matches(std::string_view input) const {
    auto m = match_prefix(input);
    return m && m->end == input.size();
}

std::shared_ptr<const Pattern> build_pattern(const NumberFormatOptions& options) {
    return std::make_shared<const Pattern>(options);
}

namespace {

struct PatternCache {
    using Order = std::list<std::string>;

    struct Slot {
        std::shared_ptr<const Pattern> pattern;
        Order::iterator position;
    };

    std::mutex mutex;
    Order order;  // most recently used first
    std::unordered_map<std::string, Slot> slots;
};

PatternCache& pattern_cache() {
    static PatternCache cache;
    return cache;
}

} // namespace

std::shared_ptr<const Pattern> cached_pattern(const NumberFormatOptions& options) {
    PatternCache& cache = pattern_cache();
    const std::string key = options_id(options);
    {
        std::lock_guard<std::mutex> lock(cache.mutex);
        auto it = cache.slots.find(key);
        if (it != cache.slots.end()) {
            cache.order.splice(cache.order.begin(), cache.order, it->second.position);
            return it->second.pattern;
        }
    }

    // Build outside the lock
    auto pattern = build_pattern(options);

    std::lock_guard<std::mutex> lock(cache.mutex);
    auto it = cache.slots.find(key);
    if (it != cache.slots.end()) {
        cache.order.splice(cache.order.begin(), cache.order, it->second.position);
        return it->second.pattern;
    }

    cache.order.push_front(key);
    cache.slots.emplace(key, PatternCache::Slot{pattern, cache.order.begin()});
    while (cache.slots.size() > pattern_cache_capacity) {
        cache.slots.erase(cache.order.back());
        cache.order.pop_back();
    }
    return pattern;
}

std::size_t pattern_cache_size() {
    PatternCache& cache = pattern_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    return cache.slots.size();
}

} // namespace numeral

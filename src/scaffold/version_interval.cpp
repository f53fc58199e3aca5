#include "scaffold/version_interval.hpp"

#include "util/path_utils.hpp"

namespace seed {

namespace {

class IntervalParser {
  public:
    explicit IntervalParser(std::string_view in) : in_(TrimSpaces(in)) {}

    IntervalParseResult Run() {
        if (in_.empty()) return std::move(out_);

        if (Peek() == '[' || Peek() == '(') {
            ParseBracketed();
        } else {
            // bare version: at least that version
            auto& iv = out_.interval;
            iv.lower = ParseBound(in_);
            iv.lower_inclusive = true;
        }
        return std::move(out_);
    }

  private:
    char Peek() const { return pos_ < in_.size() ? in_[pos_] : '\0'; }
    bool AtEnd() const { return pos_ >= in_.size(); }

    void Degrade(std::string reason) {
        if (out_.status == IntervalParseStatus::Exact) {
            out_.status = IntervalParseStatus::Degraded;
            out_.reason = std::move(reason);
        }
    }

    // Consumes characters up to (not including) one of stops.
    std::string_view TakeUntil(std::string_view stops) {
        const size_t start = pos_;
        while (!AtEnd() && stops.find(Peek()) == std::string_view::npos) ++pos_;
        return in_.substr(start, pos_ - start);
    }

    std::optional<SemanticVersion> ParseBound(std::string_view text) {
        text = TrimSpaces(text);
        if (text.empty()) return std::nullopt;

        auto v = SemanticVersion::Parse(text);
        if (!v) {
            Degrade("invalid bound '" + std::string(text) + "': " + v.error());
            return std::nullopt;
        }
        return std::move(*v);
    }

    void ParseBracketed() {
        auto& iv = out_.interval;
        iv.lower_inclusive = (Peek() == '[');
        ++pos_;

        const std::string_view lower_text = TakeUntil(",])");
        if (Peek() != ',') {
            // "[1.0.0]" or "[1.0.0": keep what reads as a lower bound
            Degrade(TrimSpaces(lower_text).empty() ? "empty interval body" : "missing ','");
            iv.lower = ParseBound(lower_text);
            ParseClose();
            return;
        }
        ++pos_;
        iv.lower = ParseBound(lower_text);

        const std::string_view upper_text = TakeUntil("])");
        iv.upper = ParseBound(upper_text);
        ParseClose();
    }

    void ParseClose() {
        auto& iv = out_.interval;
        if (AtEnd()) {
            Degrade("missing closing bracket");
            return;
        }
        iv.upper_inclusive = (Peek() == ']');
        ++pos_;
        if (!AtEnd()) {
            Degrade("unexpected trailing text '" + std::string(in_.substr(pos_)) + "'");
        }
    }

    std::string_view in_;
    size_t pos_ = 0;
    IntervalParseResult out_;
};

} // namespace

bool VersionInterval::Contains(const SemanticVersion& candidate) const {
    if (lower) {
        const int c = candidate.Compare(*lower);
        if (c < 0 || (c == 0 && !lower_inclusive)) return false;
    }
    if (upper) {
        const int c = candidate.Compare(*upper);
        if (c > 0 || (c == 0 && !upper_inclusive)) return false;
    }
    return true;
}

std::string VersionInterval::Render() const {
    if (!lower) return {};

    std::string out = (lower_inclusive ? ">=" : ">") + lower->ToString();
    if (upper) {
        out += " and ";
        out += (upper_inclusive ? "<=" : "<") + upper->ToString();
    }
    return out;
}

IntervalParseResult ParseVersionInterval(std::string_view raw) {
    return IntervalParser(raw).Run();
}

} // namespace seed

#include <profitguardian/core/storage/journal_codec.hpp>

#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace ProfitGuardian {

namespace {

class ByteWriter {
public:
    template <typename T>
    void put(T value) {
        static_assert(std::is_arithmetic<T>::value, "arithmetic only");
        const auto* p = reinterpret_cast<const uint8_t*>(&value);
        buffer_.insert(buffer_.end(), p, p + sizeof(T));
    }

    void putString(const std::string& s) {
        put<uint32_t>(static_cast<uint32_t>(s.size()));
        buffer_.insert(buffer_.end(), s.begin(), s.end());
    }

    void putOptional(const std::optional<double>& v) {
        put<uint8_t>(v.has_value() ? 1 : 0);
        if (v) {
            put<double>(*v);
        }
    }

    std::vector<uint8_t>& bytes() { return buffer_; }

private:
    std::vector<uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    template <typename T>
    T get() {
        static_assert(std::is_arithmetic<T>::value, "arithmetic only");
        require(sizeof(T));
        T value;
        std::memcpy(&value, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return value;
    }

    std::string getString() {
        const uint32_t n = get<uint32_t>();
        require(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::optional<double> getOptional() {
        if (get<uint8_t>() == 0) {
            return std::nullopt;
        }
        return get<double>();
    }

    bool done() const { return pos_ == len_; }

private:
    void require(size_t n) const {
        if (len_ - pos_ < n) {
            throw std::runtime_error("payload truncated");
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

template <typename E>
E getEnum(ByteReader& r, uint8_t max) {
    const uint8_t v = r.get<uint8_t>();
    if (v > max) {
        throw std::runtime_error("enum value out of range");
    }
    return static_cast<E>(v);
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

void writeRecord(ByteWriter& w, const TickRecord& r) {
    w.put<uint64_t>(r.tick_ms);
    w.put<uint8_t>(static_cast<uint8_t>(r.outcome));
    w.putString(r.reason);
    w.put<uint32_t>(r.evaluated);
    w.put<uint32_t>(r.stale);
    w.put<uint32_t>(r.applied);
    w.put<uint32_t>(r.failed);
    w.put<uint64_t>(r.duration_ms);
}

TickRecord readRecord(ByteReader& rd) {
    TickRecord r;
    r.tick_ms = rd.get<uint64_t>();
    r.outcome = getEnum<TickOutcome>(rd, static_cast<uint8_t>(TickOutcome::ABORTED));
    r.reason = rd.getString();
    r.evaluated = rd.get<uint32_t>();
    r.stale = rd.get<uint32_t>();
    r.applied = rd.get<uint32_t>();
    r.failed = rd.get<uint32_t>();
    r.duration_ms = rd.get<uint64_t>();
    return r;
}

void writeSnapshot(ByteWriter& w, const MetricsSnapshot& s) {
    w.putString(s.entity_id);
    w.put<uint64_t>(s.timestamp_ms);
    w.put<double>(s.spend);
    w.put<double>(s.conversions);
    w.putOptional(s.conversion_value);
    w.put<uint64_t>(s.clicks);
    w.put<uint64_t>(s.impressions);
    w.put<double>(s.elapsed_day_fraction);
}

MetricsSnapshot readSnapshot(ByteReader& rd) {
    MetricsSnapshot s;
    s.entity_id = rd.getString();
    s.timestamp_ms = rd.get<uint64_t>();
    s.spend = rd.get<double>();
    s.conversions = rd.get<double>();
    s.conversion_value = rd.getOptional();
    s.clicks = rd.get<uint64_t>();
    s.impressions = rd.get<uint64_t>();
    s.elapsed_day_fraction = rd.get<double>();
    return s;
}

void writeDecision(ByteWriter& w, const GuardianDecision& d) {
    w.putString(d.entity_id);
    w.putString(d.campaign_id);
    w.put<uint64_t>(d.tick_ms);
    w.put<uint8_t>(static_cast<uint8_t>(d.action));
    w.put<uint8_t>(static_cast<uint8_t>(d.reason));
    w.put<uint8_t>(static_cast<uint8_t>(d.prior_state));
    w.put<uint8_t>(static_cast<uint8_t>(d.proposed_state));
    w.put<uint8_t>(static_cast<uint8_t>(d.outcome));
    w.putOptional(d.pacing_ratio);
    w.put<uint8_t>(static_cast<uint8_t>(d.pacing));
    w.put<double>(d.profit);
    w.put<uint8_t>(static_cast<uint8_t>(d.basis));
    w.put<uint8_t>(static_cast<uint8_t>(d.confidence));
    w.put<uint8_t>(static_cast<uint8_t>(d.polarity));
    w.put<uint64_t>(d.window_clicks);
    w.put<uint8_t>(d.stale ? 1 : 0);
    w.put<uint32_t>(d.negative_streak);
    w.put<uint32_t>(d.positive_streak);
    w.put<uint8_t>(d.awaiting_clean_tick ? 1 : 0);
    w.put<uint8_t>(d.prior_paced ? 1 : 0);
    w.put<uint8_t>(d.paced ? 1 : 0);
    w.putString(d.idempotency_key);
    w.put<uint32_t>(d.attempts);
    w.putString(d.detail);
}

GuardianDecision readDecision(ByteReader& rd) {
    GuardianDecision d;
    d.entity_id = rd.getString();
    d.campaign_id = rd.getString();
    d.tick_ms = rd.get<uint64_t>();
    d.action = getEnum<ActionIntent>(rd, static_cast<uint8_t>(ActionIntent::REPACE));
    d.reason = getEnum<ReasonCode>(rd, static_cast<uint8_t>(ReasonCode::PACE_RESTORED));
    d.prior_state = getEnum<LifecycleState>(rd, static_cast<uint8_t>(LifecycleState::CIRCUIT_HALTED));
    d.proposed_state = getEnum<LifecycleState>(rd, static_cast<uint8_t>(LifecycleState::CIRCUIT_HALTED));
    d.outcome = getEnum<ActionOutcome>(rd, static_cast<uint8_t>(ActionOutcome::SUPERSEDED));
    d.pacing_ratio = rd.getOptional();
    d.pacing = getEnum<PacingClass>(rd, static_cast<uint8_t>(PacingClass::OVER_PACE));
    d.profit = rd.get<double>();
    d.basis = getEnum<SignalBasis>(rd, static_cast<uint8_t>(SignalBasis::PROXY));
    d.confidence = getEnum<Confidence>(rd, static_cast<uint8_t>(Confidence::HIGH));
    d.polarity = getEnum<Polarity>(rd, static_cast<uint8_t>(Polarity::POSITIVE));
    d.window_clicks = rd.get<uint64_t>();
    d.stale = rd.get<uint8_t>() != 0;
    d.negative_streak = rd.get<uint32_t>();
    d.positive_streak = rd.get<uint32_t>();
    d.awaiting_clean_tick = rd.get<uint8_t>() != 0;
    d.prior_paced = rd.get<uint8_t>() != 0;
    d.paced = rd.get<uint8_t>() != 0;
    d.idempotency_key = rd.getString();
    d.attempts = rd.get<uint32_t>();
    d.detail = rd.getString();
    return d;
}

void writeLedger(ByteWriter& w, const LossLedger& l) {
    w.putString(l.campaign_id);
    w.put<uint64_t>(l.opened_ms);
    w.put<uint32_t>(static_cast<uint32_t>(l.entries.size()));
    for (const auto& e : l.entries) {
        w.put<uint64_t>(e.interval_end_ms);
        w.put<double>(e.loss);
    }
    w.put<uint8_t>(l.halted ? 1 : 0);
    w.put<uint64_t>(l.halted_since_ms);
    w.putString(l.halt_reason);
}

LossLedger readLedger(ByteReader& rd) {
    LossLedger l;
    l.campaign_id = rd.getString();
    l.opened_ms = rd.get<uint64_t>();
    const uint32_t n = rd.get<uint32_t>();
    for (uint32_t i = 0; i < n; ++i) {
        LedgerEntry e;
        e.interval_end_ms = rd.get<uint64_t>();
        e.loss = rd.get<double>();
        l.entries.push_back(e);
    }
    l.halted = rd.get<uint8_t>() != 0;
    l.halted_since_ms = rd.get<uint64_t>();
    l.halt_reason = rd.getString();
    return l;
}

std::vector<uint8_t> frame(FrameType type, const std::vector<uint8_t>& payload) {
    ByteWriter w;
    w.put<uint32_t>(JOURNAL_MAGIC);
    w.put<uint8_t>(static_cast<uint8_t>(type));
    w.put<uint32_t>(static_cast<uint32_t>(payload.size()));
    auto& out = w.bytes();
    out.insert(out.end(), payload.begin(), payload.end());
    // Checksum covers type, length and payload
    const uint32_t sum = fnv1a(out.data() + 4, out.size() - 4);
    w.put<uint32_t>(sum);
    return std::move(w.bytes());
}

TickBatch decodePayload(FrameType type, const uint8_t* data, size_t len) {
    ByteReader rd(data, len);
    TickBatch batch;
    batch.record = readRecord(rd);

    if (type == FrameType::TICK_COMMIT) {
        const uint32_t snapshots = rd.get<uint32_t>();
        for (uint32_t i = 0; i < snapshots; ++i) {
            batch.snapshots.push_back(readSnapshot(rd));
        }
        const uint32_t decisions = rd.get<uint32_t>();
        for (uint32_t i = 0; i < decisions; ++i) {
            batch.decisions.push_back(readDecision(rd));
        }
        const uint32_t ledgers = rd.get<uint32_t>();
        for (uint32_t i = 0; i < ledgers; ++i) {
            batch.ledgers.push_back(readLedger(rd));
        }
        const uint32_t budgets = rd.get<uint32_t>();
        for (uint32_t i = 0; i < budgets; ++i) {
            std::string id = rd.getString();
            batch.budget_updates[id] = rd.get<double>();
        }
    }

    if (!rd.done()) {
        throw std::runtime_error("trailing bytes in payload");
    }
    return batch;
}

} // anonymous namespace

uint32_t fnv1a(const uint8_t* data, size_t len) {
    uint32_t hash = 2166136261u;
    for (size_t i = 0; i < len; ++i) {
        hash ^= data[i];
        hash *= 16777619u;
    }
    return hash;
}

std::vector<uint8_t> encodeTickCommit(const TickBatch& batch) {
    ByteWriter w;
    writeRecord(w, batch.record);
    w.put<uint32_t>(static_cast<uint32_t>(batch.snapshots.size()));
    for (const auto& s : batch.snapshots) {
        writeSnapshot(w, s);
    }
    w.put<uint32_t>(static_cast<uint32_t>(batch.decisions.size()));
    for (const auto& d : batch.decisions) {
        writeDecision(w, d);
    }
    w.put<uint32_t>(static_cast<uint32_t>(batch.ledgers.size()));
    for (const auto& l : batch.ledgers) {
        writeLedger(w, l);
    }
    w.put<uint32_t>(static_cast<uint32_t>(batch.budget_updates.size()));
    for (const auto& [id, budget] : batch.budget_updates) {
        w.putString(id);
        w.put<double>(budget);
    }
    return frame(FrameType::TICK_COMMIT, w.bytes());
}

std::vector<uint8_t> encodeTickOutcome(const TickRecord& record) {
    ByteWriter w;
    writeRecord(w, record);
    return frame(FrameType::TICK_OUTCOME, w.bytes());
}

DecodeResult decodeJournal(const uint8_t* data, size_t len) {
    DecodeResult result;
    size_t pos = 0;

    while (pos < len) {
        if (len - pos < FRAME_OVERHEAD) {
            result.error = "truncated frame header";
            break;
        }

        uint32_t magic;
        std::memcpy(&magic, data + pos, sizeof(magic));
        if (magic != JOURNAL_MAGIC) {
            result.error = "bad frame magic";
            break;
        }

        const uint8_t raw_type = data[pos + 4];
        uint32_t payload_len;
        std::memcpy(&payload_len, data + pos + 5, sizeof(payload_len));
        if (len - pos - FRAME_OVERHEAD < payload_len) {
            result.error = "truncated frame payload";
            break;
        }

        const uint8_t* payload = data + pos + 9;
        uint32_t stored_sum;
        std::memcpy(&stored_sum, payload + payload_len, sizeof(stored_sum));
        if (fnv1a(data + pos + 4, 5 + payload_len) != stored_sum) {
            result.error = "checksum mismatch";
            break;
        }

        if (raw_type != static_cast<uint8_t>(FrameType::TICK_COMMIT)
            && raw_type != static_cast<uint8_t>(FrameType::TICK_OUTCOME)) {
            result.error = "unknown frame type";
            break;
        }

        JournalFrame f;
        f.type = static_cast<FrameType>(raw_type);
        try {
            f.batch = decodePayload(f.type, payload, payload_len);
        } catch (const std::exception& e) {
            result.error = std::string("malformed payload: ") + e.what();
            break;
        }

        result.frames.push_back(std::move(f));
        pos += FRAME_OVERHEAD + payload_len;
        result.valid_bytes = pos;
    }
    return result;
}

} // namespace ProfitGuardian

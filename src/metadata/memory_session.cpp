#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <engram/core/text_tokens.h>
#include <engram/metadata/memory_session.h>

namespace engram::metadata {

using json = nlohmann::json;

namespace {

using BindValue = std::variant<std::string, int64_t, double>;

constexpr size_t kInListChunk = 500;

// Effective occurrence interval, see effectiveOccurrence()
constexpr const char* kEffStart = "COALESCE(occurred_start, occurred_end, mentioned_at)";
constexpr const char* kEffEnd = "COALESCE(occurred_end, occurred_start, mentioned_at)";

constexpr const char* kUnitColumns =
    "id, bank_id, text, fact_type, confidence, embedding, occurred_start, occurred_end, "
    "mentioned_at, context, document_id";

constexpr const char* kStatsColumns =
    "id, fact_type, confidence, mentioned_at, occurred_start, occurred_end";

constexpr const char* kBankColumns =
    "id, name, background, openness, conscientiousness, extraversion, agreeableness, "
    "neuroticism, bias_strength, skepticism, literalism, empathy, created_at, updated_at";

constexpr const char* kOperationColumns =
    "id, bank_id, kind, state, payload, result, error, created_at, updated_at";

std::string placeholders(size_t n) {
    std::string out;
    out.reserve(n * 3);
    for (size_t i = 0; i < n; ++i) {
        if (i > 0)
            out += ", ";
        out += '?';
    }
    return out;
}

Result<void> bindValues(Statement& stmt, const std::vector<BindValue>& values, int start = 1) {
    int index = start;
    for (const auto& v : values) {
        auto r = std::visit([&](const auto& x) { return stmt.bind(index, x); }, v);
        if (!r)
            return r;
        ++index;
    }
    return {};
}

// Appends "AND ..." admission clauses for a unit filter
void appendFilter(std::string& sql, std::vector<BindValue>& binds, const UnitFilter& filter,
                  const std::string& alias = "") {
    if (!filter.factTypes.empty()) {
        sql += " AND " + alias + "fact_type IN (" + placeholders(filter.factTypes.size()) + ")";
        for (auto t : filter.factTypes) {
            binds.emplace_back(std::string(factTypeToString(t)));
        }
    }
    if (filter.timeRange) {
        std::string effStart = kEffStart;
        std::string effEnd = kEffEnd;
        if (!alias.empty()) {
            effStart = "COALESCE(" + alias + "occurred_start, " + alias + "occurred_end, " + alias +
                       "mentioned_at)";
            effEnd = "COALESCE(" + alias + "occurred_end, " + alias + "occurred_start, " + alias +
                     "mentioned_at)";
        }
        sql += " AND " + effStart + " <= ? AND " + effEnd + " >= ?";
        binds.emplace_back(toEpochMillis(filter.timeRange->end));
        binds.emplace_back(toEpochMillis(filter.timeRange->start));
    }
}

FactType readFactType(const Statement& stmt, int column) {
    auto parsed = factTypeFromString(stmt.getString(column));
    return parsed.value_or(FactType::World);
}

MemoryUnit readUnit(const Statement& stmt) {
    MemoryUnit unit;
    unit.id = stmt.getString(0);
    unit.bankId = stmt.getString(1);
    unit.text = stmt.getString(2);
    unit.factType = readFactType(stmt, 3);
    unit.confidence = stmt.getDouble(4);
    unit.embedding = decodeEmbedding(stmt.getBlob(5));
    unit.occurredStart = stmt.getOptionalTime(6);
    unit.occurredEnd = stmt.getOptionalTime(7);
    unit.mentionedAt = stmt.getTime(8);
    unit.context = stmt.getString(9);
    unit.documentId = stmt.getOptionalString(10);
    return unit;
}

UnitStats readStats(const Statement& stmt) {
    UnitStats stats;
    stats.id = stmt.getString(0);
    stats.factType = readFactType(stmt, 1);
    stats.confidence = stmt.getDouble(2);
    stats.mentionedAt = stmt.getTime(3);
    stats.occurredStart = stmt.getOptionalTime(4);
    stats.occurredEnd = stmt.getOptionalTime(5);
    return stats;
}

Bank readBank(const Statement& stmt) {
    Bank bank;
    bank.id = stmt.getString(0);
    bank.name = stmt.getString(1);
    bank.background = stmt.getString(2);
    bank.personality.openness = stmt.getDouble(3);
    bank.personality.conscientiousness = stmt.getDouble(4);
    bank.personality.extraversion = stmt.getDouble(5);
    bank.personality.agreeableness = stmt.getDouble(6);
    bank.personality.neuroticism = stmt.getDouble(7);
    bank.personality.biasStrength = stmt.getDouble(8);
    bank.disposition.skepticism = stmt.getInt(9);
    bank.disposition.literalism = stmt.getInt(10);
    bank.disposition.empathy = stmt.getInt(11);
    bank.createdAt = stmt.getTime(12);
    bank.updatedAt = stmt.getTime(13);
    return bank;
}

AsyncOperation readOperation(const Statement& stmt) {
    AsyncOperation op;
    op.id = stmt.getString(0);
    op.bankId = stmt.getString(1);
    op.kind = stmt.getString(2);
    op.state = operationStateFromString(stmt.getString(3)).value_or(OperationState::Failed);
    op.payload = stmt.getString(4);
    op.result = stmt.getOptionalString(5);
    op.error = stmt.getOptionalString(6);
    op.createdAt = stmt.getTime(7);
    op.updatedAt = stmt.getTime(8);
    return op;
}

std::string encodeMetadata(const std::map<std::string, std::string>& metadata) {
    json j = json::object();
    for (const auto& [k, v] : metadata) {
        j[k] = v;
    }
    return j.dump();
}

std::map<std::string, std::string> decodeMetadata(const std::string& text) {
    std::map<std::string, std::string> out;
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("[MemoryStore] Ignoring malformed document metadata");
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return out;
}

// Runs "prefix (?, ?, ...) suffix" once per chunk of ids; the bank id binds first
template <typename RowFn>
Result<void> queryByIds(Database& db, const std::string& prefix, const std::string& suffix,
                        const std::string& bankId, const std::vector<std::string>& ids,
                        RowFn&& onRow) {
    for (size_t offset = 0; offset < ids.size(); offset += kInListChunk) {
        const size_t n = std::min(kInListChunk, ids.size() - offset);
        auto stmtResult = db.prepare(prefix + "(" + placeholders(n) + ")" + suffix);
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();

        auto b = stmt.bind(1, bankId);
        if (!b)
            return b;
        for (size_t i = 0; i < n; ++i) {
            b = stmt.bind(static_cast<int>(i + 2), ids[offset + i]);
            if (!b)
                return b;
        }

        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            onRow(stmt);
        }
    }
    return {};
}

template <typename RowFn>
Result<void> collectRows(Statement& stmt, RowFn&& onRow) {
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return {};
        onRow(stmt);
    }
}

Result<int64_t> countRows(Database& db, const std::string& sql,
                          const std::vector<BindValue>& binds) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stepResult.value() ? stmt.getInt64(0) : int64_t{0};
}

Result<std::map<std::string, int64_t>> countGrouped(Database& db, const std::string& sql,
                                                    const std::string& bankId) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bind(1, bankId);
    if (!b)
        return b.error();
    std::map<std::string, int64_t> out;
    auto rows = collectRows(stmt, [&](const Statement& s) { out[s.getString(0)] = s.getInt64(1); });
    if (!rows)
        return rows.error();
    return out;
}

void sortScored(std::vector<ScoredUnitId>& scored, size_t limit) {
    std::sort(scored.begin(), scored.end(), [](const ScoredUnitId& a, const ScoredUnitId& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.id < b.id;
    });
    if (scored.size() > limit)
        scored.resize(limit);
}

std::string ftsMatchExpression(const std::vector<std::string>& tokens) {
    std::string expr;
    for (const auto& t : tokens) {
        if (!expr.empty())
            expr += " OR ";
        expr += '"' + t + '"';
    }
    return expr;
}

std::vector<std::string> queryTerms(const std::string& text) {
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    for (auto& t : core::tokenizeWords(text)) {
        if (core::isStopWord(t))
            continue;
        if (seen.insert(t).second)
            terms.push_back(std::move(t));
    }
    return terms;
}

} // namespace

// ---------------------------------------------------------------------------
// Banks
// ---------------------------------------------------------------------------

Result<Bank> MemorySession::ensureBank(const std::string& bankId) {
    auto stmtResult = db_.prepare("INSERT OR IGNORE INTO banks (id, name, background, created_at, "
                                  "updated_at) VALUES (?, ?, '', ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    const auto now = std::chrono::system_clock::now();
    auto b = stmt.bindAll(bankId, bankId, now, now);
    if (!b)
        return b.error();
    auto ex = stmt.execute();
    if (!ex)
        return ex.error();
    if (db_.changes() > 0) {
        spdlog::info("[MemoryStore] Created bank '{}'", bankId);
    }

    auto bank = getBank(bankId);
    if (!bank)
        return bank.error();
    if (!bank.value())
        return Error{ErrorCode::InternalError, "Bank vanished after creation: " + bankId};
    return *bank.value();
}

Result<std::optional<Bank>> MemorySession::getBank(const std::string& bankId) {
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kBankColumns + " FROM banks WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bind(1, bankId);
    if (!b)
        return b.error();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<Bank>{};
    return std::optional<Bank>{readBank(stmt)};
}

Result<void> MemorySession::updateBank(const Bank& bank) {
    if (!bank.personality.isValid())
        return Error{ErrorCode::ValidationError, "Personality traits must be within [0,1]"};
    if (!bank.disposition.isValid())
        return Error{ErrorCode::ValidationError, "Disposition traits must be within [1,5]"};

    auto stmtResult = db_.prepare(
        "UPDATE banks SET name = ?, background = ?, openness = ?, conscientiousness = ?, "
        "extraversion = ?, agreeableness = ?, neuroticism = ?, bias_strength = ?, "
        "skepticism = ?, literalism = ?, empathy = ?, updated_at = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    const auto& p = bank.personality;
    const auto& d = bank.disposition;
    auto b = stmt.bindAll(bank.name, bank.background, p.openness, p.conscientiousness,
                          p.extraversion, p.agreeableness, p.neuroticism, p.biasStrength,
                          d.skepticism, d.literalism, d.empathy, std::chrono::system_clock::now(),
                          bank.id);
    if (!b)
        return b;
    auto ex = stmt.execute();
    if (!ex)
        return ex;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "Bank not found: " + bank.id};
    return {};
}

Result<std::vector<Bank>> MemorySession::listBanks() {
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kBankColumns + " FROM banks ORDER BY id");
    if (!stmtResult)
        return stmtResult.error();
    std::vector<Bank> banks;
    auto rows =
        collectRows(stmtResult.value(), [&](const Statement& s) { banks.push_back(readBank(s)); });
    if (!rows)
        return rows.error();
    return banks;
}

Result<BankStats> MemorySession::bankStats(const std::string& bankId) {
    BankStats stats;
    stats.bankId = bankId;

    auto byType = countGrouped(
        db_, "SELECT fact_type, COUNT(*) FROM memory_units WHERE bank_id = ? GROUP BY fact_type",
        bankId);
    if (!byType)
        return byType.error();
    stats.unitsByFactType = std::move(byType).value();
    for (const auto& [_, n] : stats.unitsByFactType) {
        stats.totalUnits += n;
    }

    auto docs = countRows(db_, "SELECT COUNT(*) FROM documents WHERE bank_id = ?", {bankId});
    if (!docs)
        return docs.error();
    stats.documents = docs.value();

    auto ents = countRows(db_, "SELECT COUNT(*) FROM entities WHERE bank_id = ?", {bankId});
    if (!ents)
        return ents.error();
    stats.entities = ents.value();

    auto links = countGrouped(
        db_, "SELECT kind, COUNT(*) FROM memory_links WHERE bank_id = ? GROUP BY kind", bankId);
    if (!links)
        return links.error();
    stats.linksByKind = std::move(links).value();

    auto ops = countGrouped(
        db_, "SELECT state, COUNT(*) FROM async_operations WHERE bank_id = ? GROUP BY state",
        bankId);
    if (!ops)
        return ops.error();
    stats.operationsByState = std::move(ops).value();

    return stats;
}

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------

Result<std::optional<Document>> MemorySession::getDocument(const std::string& bankId,
                                                           const std::string& documentId) {
    auto stmtResult = db_.prepare(
        "SELECT d.id, d.bank_id, d.content, d.metadata, d.created_at, d.updated_at, "
        "(SELECT COUNT(*) FROM unit_sources s WHERE s.bank_id = d.bank_id "
        "AND s.document_id = d.id) FROM documents d WHERE d.bank_id = ? AND d.id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(bankId, documentId);
    if (!b)
        return b.error();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<Document>{};

    Document doc;
    doc.id = stmt.getString(0);
    doc.bankId = stmt.getString(1);
    doc.content = stmt.getString(2);
    doc.metadata = decodeMetadata(stmt.getString(3));
    doc.createdAt = stmt.getTime(4);
    doc.updatedAt = stmt.getTime(5);
    doc.unitCount = stmt.getInt64(6);
    return std::optional<Document>{std::move(doc)};
}

Result<void> MemorySession::insertDocument(const Document& document) {
    auto stmtResult = db_.prepare("INSERT INTO documents (bank_id, id, content, metadata, "
                                  "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(document.bankId, document.id, document.content,
                          encodeMetadata(document.metadata), document.createdAt,
                          document.updatedAt);
    if (!b)
        return b;
    return stmt.execute();
}

Result<DocumentDeletion> MemorySession::deleteDocumentCascade(const std::string& bankId,
                                                              const std::string& documentId) {
    DocumentDeletion deletion;

    auto existing = getDocument(bankId, documentId);
    if (!existing)
        return existing.error();
    if (!existing.value())
        return deletion;
    deletion.existed = true;

    std::vector<std::string> sourced;
    {
        auto stmtResult = db_.prepare(
            "SELECT unit_id FROM unit_sources WHERE bank_id = ? AND document_id = ?");
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();
        auto b = stmt.bindAll(bankId, documentId);
        if (!b)
            return b.error();
        auto rows = collectRows(stmt, [&](const Statement& s) { sourced.push_back(s.getString(0)); });
        if (!rows)
            return rows.error();
    }

    // unit_sources rows for the document go with it
    {
        auto stmtResult = db_.prepare("DELETE FROM documents WHERE bank_id = ? AND id = ?");
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();
        auto b = stmt.bindAll(bankId, documentId);
        if (!b)
            return b.error();
        auto ex = stmt.execute();
        if (!ex)
            return ex.error();
    }

    // Units that no longer have any source are removed, unless they were also retained
    // without a document.
    for (size_t offset = 0; offset < sourced.size(); offset += kInListChunk) {
        const size_t n = std::min(kInListChunk, sourced.size() - offset);
        auto stmtResult = db_.prepare(
            "DELETE FROM memory_units WHERE bank_id = ? AND retained_directly = 0 AND id IN (" +
            placeholders(n) +
            ") AND NOT EXISTS (SELECT 1 FROM unit_sources s WHERE s.unit_id = memory_units.id)");
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();
        auto b = stmt.bind(1, bankId);
        for (size_t i = 0; b && i < n; ++i) {
            b = stmt.bind(static_cast<int>(i + 2), sourced[offset + i]);
        }
        if (!b)
            return b.error();
        auto ex = stmt.execute();
        if (!ex)
            return ex.error();
        deletion.unitsDeleted += db_.changes();
    }

    // Survivors that named this document as origin point at a remaining source
    {
        auto stmtResult = db_.prepare(
            "UPDATE memory_units SET document_id = (SELECT s.document_id FROM unit_sources s "
            "WHERE s.unit_id = memory_units.id ORDER BY s.document_id LIMIT 1) "
            "WHERE bank_id = ? AND document_id = ?");
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();
        auto b = stmt.bindAll(bankId, documentId);
        if (!b)
            return b.error();
        auto ex = stmt.execute();
        if (!ex)
            return ex.error();
    }

    spdlog::debug("[MemoryStore] Deleted document '{}' in bank '{}' ({} units removed)",
                  documentId, bankId, deletion.unitsDeleted);
    return deletion;
}

Result<Page<Document>> MemorySession::listDocuments(const std::string& bankId,
                                                    const ListQuery& query) {
    std::vector<BindValue> binds{bankId};
    QueryBuilder qb;
    qb.select({"d.id", "d.bank_id", "d.content", "d.metadata", "d.created_at", "d.updated_at",
               "(SELECT COUNT(*) FROM unit_sources s WHERE s.bank_id = d.bank_id AND "
               "s.document_id = d.id)"})
        .from("documents d")
        .where("d.bank_id = ?");
    QueryBuilder countQb;
    countQb.select({"COUNT(*)"}).from("documents d").where("d.bank_id = ?");
    if (query.q && !query.q->empty()) {
        qb.andWhere("(d.id LIKE ? OR d.content LIKE ?)");
        countQb.andWhere("(d.id LIKE ? OR d.content LIKE ?)");
        const std::string pattern = "%" + *query.q + "%";
        binds.emplace_back(pattern);
        binds.emplace_back(pattern);
    }
    qb.orderBy("d.created_at DESC, d.id").limit(query.limit).offset(query.offset);

    Page<Document> page;
    page.limit = query.limit;
    page.offset = query.offset;

    auto total = countRows(db_, countQb.build(), binds);
    if (!total)
        return total.error();
    page.total = total.value();

    auto stmtResult = db_.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    auto rows = collectRows(stmt, [&](const Statement& s) {
        Document doc;
        doc.id = s.getString(0);
        doc.bankId = s.getString(1);
        doc.content = s.getString(2);
        doc.metadata = decodeMetadata(s.getString(3));
        doc.createdAt = s.getTime(4);
        doc.updatedAt = s.getTime(5);
        doc.unitCount = s.getInt64(6);
        page.items.push_back(std::move(doc));
    });
    if (!rows)
        return rows.error();
    return page;
}

// ---------------------------------------------------------------------------
// Memory units
// ---------------------------------------------------------------------------

Result<void> MemorySession::insertUnit(const MemoryUnit& unit) {
    auto stmtResult = db_.prepare(
        "INSERT INTO memory_units (id, bank_id, text, fact_type, confidence, embedding, "
        "occurred_start, occurred_end, mentioned_at, context, document_id, retained_directly, "
        "created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    const auto blob = encodeEmbedding(unit.embedding);
    auto b = stmt.bindAll(unit.id, unit.bankId, unit.text, factTypeToString(unit.factType),
                          unit.confidence, std::span<const std::byte>(blob.data(), blob.size()),
                          unit.occurredStart, unit.occurredEnd, unit.mentionedAt, unit.context,
                          unit.documentId, unit.documentId ? 0 : 1,
                          std::chrono::system_clock::now());
    if (!b)
        return b;
    auto ex = stmt.execute();
    if (!ex)
        return ex;

    if (unit.documentId) {
        return addUnitSource(unit.bankId, unit.id, *unit.documentId);
    }
    return {};
}

Result<void> MemorySession::addUnitSource(const std::string& bankId, const std::string& unitId,
                                          const std::string& documentId) {
    auto stmtResult = db_.prepare(
        "INSERT OR IGNORE INTO unit_sources (unit_id, bank_id, document_id) VALUES (?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(unitId, bankId, documentId);
    if (!b)
        return b;
    return stmt.execute();
}

Result<void> MemorySession::updateConfidence(const std::string& bankId, const std::string& unitId,
                                             double confidence) {
    auto stmtResult =
        db_.prepare("UPDATE memory_units SET confidence = ? WHERE bank_id = ? AND id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(std::clamp(confidence, 0.0, 1.0), bankId, unitId);
    if (!b)
        return b;
    auto ex = stmt.execute();
    if (!ex)
        return ex;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "Memory unit not found: " + unitId};
    return {};
}

Result<void> MemorySession::markRetainedDirectly(const std::string& bankId,
                                                 const std::string& unitId) {
    auto stmtResult = db_.prepare(
        "UPDATE memory_units SET retained_directly = 1 WHERE bank_id = ? AND id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(bankId, unitId);
    if (!b)
        return b;
    auto ex = stmt.execute();
    if (!ex)
        return ex;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "Memory unit not found: " + unitId};
    return {};
}

Result<std::optional<MemoryUnit>> MemorySession::getUnit(const std::string& bankId,
                                                         const std::string& unitId) {
    auto units = getUnits(bankId, {unitId});
    if (!units)
        return units.error();
    if (units.value().empty())
        return std::optional<MemoryUnit>{};
    return std::optional<MemoryUnit>{std::move(units.value().front())};
}

Result<std::vector<MemoryUnit>> MemorySession::getUnits(const std::string& bankId,
                                                        const std::vector<std::string>& unitIds) {
    std::vector<MemoryUnit> units;
    auto r = queryByIds(db_,
                        std::string("SELECT ") + kUnitColumns +
                            " FROM memory_units WHERE bank_id = ? AND id IN ",
                        "", bankId, unitIds,
                        [&](const Statement& s) { units.push_back(readUnit(s)); });
    if (!r)
        return r.error();

    std::vector<std::string> ids;
    ids.reserve(units.size());
    for (const auto& u : units)
        ids.push_back(u.id);
    auto pairs = unitEntityPairsForUnits(bankId, ids);
    if (!pairs)
        return pairs.error();
    std::unordered_map<std::string, std::vector<std::string>> byUnit;
    for (auto& [unitId, entityId] : pairs.value()) {
        byUnit[unitId].push_back(entityId);
    }
    for (auto& u : units) {
        auto it = byUnit.find(u.id);
        if (it != byUnit.end()) {
            u.entityIds = std::move(it->second);
            std::sort(u.entityIds.begin(), u.entityIds.end());
        }
    }
    return units;
}

Result<std::vector<UnitStats>>
MemorySession::getUnitStats(const std::string& bankId, const std::vector<std::string>& unitIds) {
    std::vector<UnitStats> stats;
    auto r = queryByIds(db_,
                        std::string("SELECT ") + kStatsColumns +
                            " FROM memory_units WHERE bank_id = ? AND id IN ",
                        "", bankId, unitIds,
                        [&](const Statement& s) { stats.push_back(readStats(s)); });
    if (!r)
        return r.error();
    return stats;
}

Result<Page<MemoryUnit>> MemorySession::listUnits(const std::string& bankId,
                                                  const ListQuery& query) {
    std::vector<BindValue> binds{bankId};
    QueryBuilder qb;
    qb.select({kUnitColumns}).from("memory_units").where("bank_id = ?");
    QueryBuilder countQb;
    countQb.select({"COUNT(*)"}).from("memory_units").where("bank_id = ?");
    if (query.factType) {
        qb.andWhere("fact_type = ?");
        countQb.andWhere("fact_type = ?");
        binds.emplace_back(std::string(factTypeToString(*query.factType)));
    }
    if (query.q && !query.q->empty()) {
        qb.andWhere("text LIKE ?");
        countQb.andWhere("text LIKE ?");
        binds.emplace_back("%" + *query.q + "%");
    }
    qb.orderBy("mentioned_at DESC, seq DESC").limit(query.limit).offset(query.offset);

    Page<MemoryUnit> page;
    page.limit = query.limit;
    page.offset = query.offset;

    auto total = countRows(db_, countQb.build(), binds);
    if (!total)
        return total.error();
    page.total = total.value();

    auto stmtResult = db_.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    auto rows = collectRows(stmt, [&](const Statement& s) { page.items.push_back(readUnit(s)); });
    if (!rows)
        return rows.error();
    return page;
}

Result<bool> MemorySession::deleteUnit(const std::string& bankId, const std::string& unitId) {
    auto stmtResult = db_.prepare("DELETE FROM memory_units WHERE bank_id = ? AND id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(bankId, unitId);
    if (!b)
        return b.error();
    auto ex = stmt.execute();
    if (!ex)
        return ex.error();
    return db_.changes() > 0;
}

Result<int64_t> MemorySession::deleteUnits(const std::string& bankId,
                                           std::optional<FactType> factType) {
    QueryBuilder qb;
    qb.deleteFrom("memory_units").where("bank_id = ?");
    std::vector<BindValue> binds{bankId};
    if (factType) {
        qb.andWhere("fact_type = ?");
        binds.emplace_back(std::string(factTypeToString(*factType)));
    }
    auto stmtResult = db_.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    auto ex = stmt.execute();
    if (!ex)
        return ex.error();
    return static_cast<int64_t>(db_.changes());
}

// ---------------------------------------------------------------------------
// Search primitives
// ---------------------------------------------------------------------------

Result<std::vector<ScoredUnitId>> MemorySession::nearestUnits(const std::string& bankId,
                                                              const Embedding& query,
                                                              size_t limit, double minSimilarity,
                                                              const UnitFilter& filter) {
    std::string sql = "SELECT id, embedding FROM memory_units WHERE bank_id = ?";
    std::vector<BindValue> binds{bankId};
    appendFilter(sql, binds, filter);

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();

    std::vector<ScoredUnitId> scored;
    size_t mismatched = 0;
    auto rows = collectRows(stmt, [&](const Statement& s) {
        auto embedding = decodeEmbedding(s.getBlob(1));
        if (embedding.size() != query.size()) {
            ++mismatched;
            return;
        }
        double sim = cosineSimilarity(query, embedding);
        if (sim >= minSimilarity) {
            scored.push_back({s.getString(0), sim});
        }
    });
    if (!rows)
        return rows.error();
    if (mismatched > 0) {
        spdlog::warn("[MemoryStore] Skipped {} units with embedding dimension != {}", mismatched,
                     query.size());
    }

    sortScored(scored, limit);
    return scored;
}

Result<bool> MemorySession::hasFullTextIndex() {
    if (!ftsAvailable_) {
        auto exists = db_.tableExists("memory_units_fts");
        if (!exists)
            return exists.error();
        ftsAvailable_ = exists.value();
    }
    return *ftsAvailable_;
}

Result<std::vector<ScoredUnitId>> MemorySession::lexicalSearch(const std::string& bankId,
                                                               const std::string& text,
                                                               size_t limit,
                                                               const UnitFilter& filter) {
    const auto terms = queryTerms(text);
    if (terms.empty() || limit == 0)
        return std::vector<ScoredUnitId>{};

    auto fts = hasFullTextIndex();
    if (!fts)
        return fts.error();
    if (!fts.value())
        return lexicalSearchFallback(bankId, text, limit, filter);

    std::string sql = "SELECT u.id, -bm25(memory_units_fts) AS score FROM memory_units_fts "
                      "JOIN memory_units u ON u.seq = memory_units_fts.rowid "
                      "WHERE memory_units_fts MATCH ? AND u.bank_id = ?";
    std::vector<BindValue> binds{ftsMatchExpression(terms), bankId};
    appendFilter(sql, binds, filter, "u.");
    sql += " ORDER BY score DESC, u.id LIMIT ?";
    binds.emplace_back(static_cast<int64_t>(limit));

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();

    std::vector<ScoredUnitId> scored;
    auto rows = collectRows(
        stmt, [&](const Statement& s) { scored.push_back({s.getString(0), s.getDouble(1)}); });
    if (!rows)
        return rows.error();
    return scored;
}

// BM25 (k1 = 1.2, b = 0.75) over the admitted units of the bank
Result<std::vector<ScoredUnitId>>
MemorySession::lexicalSearchFallback(const std::string& bankId, const std::string& text,
                                     size_t limit, const UnitFilter& filter) {
    constexpr double k1 = 1.2;
    constexpr double bParam = 0.75;

    std::string sql = "SELECT id, text FROM memory_units WHERE bank_id = ?";
    std::vector<BindValue> binds{bankId};
    appendFilter(sql, binds, filter);

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto bound = bindValues(stmt, binds);
    if (!bound)
        return bound.error();

    struct Doc {
        std::string id;
        std::unordered_map<std::string, int> tf;
        size_t length = 0;
    };
    std::vector<Doc> docs;
    auto rows = collectRows(stmt, [&](const Statement& s) {
        Doc d;
        d.id = s.getString(0);
        for (auto& t : core::tokenizeWords(s.getString(1))) {
            ++d.tf[t];
            ++d.length;
        }
        docs.push_back(std::move(d));
    });
    if (!rows)
        return rows.error();
    if (docs.empty())
        return std::vector<ScoredUnitId>{};

    double avgLength = 0.0;
    for (const auto& d : docs)
        avgLength += static_cast<double>(d.length);
    avgLength = std::max(1.0, avgLength / static_cast<double>(docs.size()));

    const auto terms = queryTerms(text);
    std::unordered_map<std::string, size_t> docFreq;
    for (const auto& d : docs) {
        for (const auto& t : terms) {
            if (d.tf.count(t))
                ++docFreq[t];
        }
    }

    const double n = static_cast<double>(docs.size());
    std::vector<ScoredUnitId> scored;
    for (const auto& d : docs) {
        double score = 0.0;
        for (const auto& t : terms) {
            auto it = d.tf.find(t);
            if (it == d.tf.end())
                continue;
            const double df = static_cast<double>(docFreq[t]);
            const double idf = std::log(1.0 + (n - df + 0.5) / (df + 0.5));
            const double f = static_cast<double>(it->second);
            const double norm = k1 * (1.0 - bParam + bParam * static_cast<double>(d.length) / avgLength);
            score += idf * (f * (k1 + 1.0)) / (f + norm);
        }
        if (score > 0.0)
            scored.push_back({d.id, score});
    }
    sortScored(scored, limit);
    return scored;
}

Result<std::vector<UnitStats>> MemorySession::unitsInRange(const std::string& bankId,
                                                           const UnitFilter& filter, size_t limit) {
    if (!filter.timeRange)
        return Error{ErrorCode::InvalidArgument, "unitsInRange requires a time range"};

    std::string sql =
        std::string("SELECT ") + kStatsColumns + " FROM memory_units WHERE bank_id = ?";
    std::vector<BindValue> binds{bankId};
    appendFilter(sql, binds, filter);

    // Closest occurrence midpoint to the middle of the range first
    const int64_t mid = toEpochMillis(filter.timeRange->start) +
                        (toEpochMillis(filter.timeRange->end) -
                         toEpochMillis(filter.timeRange->start)) /
                            2;
    sql += std::string(" ORDER BY ABS((") + kEffStart + " + " + kEffEnd +
           ") / 2 - ?), mentioned_at DESC, id LIMIT ?";
    binds.emplace_back(mid);
    binds.emplace_back(static_cast<int64_t>(limit));

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    std::vector<UnitStats> out;
    auto rows = collectRows(stmt, [&](const Statement& s) { out.push_back(readStats(s)); });
    if (!rows)
        return rows.error();
    return out;
}

Result<std::vector<TemporalCandidate>>
MemorySession::temporalCandidates(const std::string& bankId, const TimeRange& window,
                                  const std::optional<std::string>& documentId, size_t limit) {
    auto stmtResult = db_.prepare(std::string("SELECT ") + kStatsColumns +
                                  ", document_id FROM memory_units WHERE bank_id = ? AND "
                                  "((document_id IS NOT NULL AND document_id = ?) OR (" +
                                  kEffStart + " <= ? AND " + kEffEnd +
                                  " >= ?)) ORDER BY mentioned_at DESC, id LIMIT ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(bankId, documentId, window.end, window.start, limit);
    if (!b)
        return b.error();

    std::vector<TemporalCandidate> out;
    auto rows = collectRows(stmt, [&](const Statement& s) {
        TemporalCandidate c;
        c.stats = readStats(s);
        c.documentId = s.getOptionalString(6);
        out.push_back(std::move(c));
    });
    if (!rows)
        return rows.error();
    return out;
}

// ---------------------------------------------------------------------------
// Entities
// ---------------------------------------------------------------------------

Result<std::vector<Entity>> MemorySession::listEntities(const std::string& bankId) {
    auto stmtResult = db_.prepare("SELECT id, bank_id, name, type, canonical_name FROM entities "
                                  "WHERE bank_id = ? ORDER BY canonical_name");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bind(1, bankId);
    if (!b)
        return b.error();
    std::vector<Entity> out;
    auto rows = collectRows(stmt, [&](const Statement& s) {
        out.push_back(Entity{s.getString(0), s.getString(1), s.getString(2), s.getString(3),
                             s.getString(4)});
    });
    if (!rows)
        return rows.error();
    return out;
}

Result<void> MemorySession::insertEntity(const Entity& entity) {
    auto stmtResult = db_.prepare("INSERT INTO entities (id, bank_id, name, type, canonical_name, "
                                  "created_at) VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(entity.id, entity.bankId, entity.name, entity.type,
                          entity.canonicalName, std::chrono::system_clock::now());
    if (!b)
        return b;
    return stmt.execute();
}

Result<void> MemorySession::linkUnitEntity(const std::string& bankId, const std::string& unitId,
                                           const std::string& entityId) {
    auto stmtResult = db_.prepare(
        "INSERT OR IGNORE INTO unit_entities (unit_id, entity_id, bank_id) VALUES (?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(unitId, entityId, bankId);
    if (!b)
        return b;
    return stmt.execute();
}

Result<std::vector<std::pair<std::string, std::string>>>
MemorySession::unitEntityPairsForEntities(const std::string& bankId,
                                          const std::vector<std::string>& entityIds) {
    std::vector<std::pair<std::string, std::string>> out;
    auto r = queryByIds(
        db_, "SELECT unit_id, entity_id FROM unit_entities WHERE bank_id = ? AND entity_id IN ",
        " ORDER BY unit_id", bankId, entityIds,
        [&](const Statement& s) { out.emplace_back(s.getString(0), s.getString(1)); });
    if (!r)
        return r.error();
    return out;
}

Result<std::vector<std::pair<std::string, std::string>>>
MemorySession::unitEntityPairsForUnits(const std::string& bankId,
                                       const std::vector<std::string>& unitIds) {
    std::vector<std::pair<std::string, std::string>> out;
    auto r = queryByIds(
        db_, "SELECT unit_id, entity_id FROM unit_entities WHERE bank_id = ? AND unit_id IN ",
        " ORDER BY unit_id", bankId, unitIds,
        [&](const Statement& s) { out.emplace_back(s.getString(0), s.getString(1)); });
    if (!r)
        return r.error();
    return out;
}

// ---------------------------------------------------------------------------
// Links
// ---------------------------------------------------------------------------

Result<void> MemorySession::insertLink(const std::string& bankId, const MemoryLink& link) {
    if (link.fromUnitId == link.toUnitId)
        return Error{ErrorCode::InvalidArgument, "Self links are not stored"};

    auto stmtResult = db_.prepare(
        "INSERT INTO memory_links (from_unit_id, to_unit_id, bank_id, kind, weight, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT(from_unit_id, to_unit_id, kind) "
        "DO UPDATE SET weight = MAX(weight, excluded.weight)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(link.fromUnitId, link.toUnitId, bankId, linkKindToString(link.kind),
                          std::clamp(link.weight, 0.0, 1.0), std::chrono::system_clock::now());
    if (!b)
        return b;
    return stmt.execute();
}

Result<std::vector<MemoryLink>>
MemorySession::linksForUnits(const std::string& bankId, const std::vector<std::string>& unitIds) {
    std::vector<MemoryLink> out;
    for (size_t offset = 0; offset < unitIds.size(); offset += kInListChunk) {
        const size_t n = std::min(kInListChunk, unitIds.size() - offset);
        const std::string list = "(" + placeholders(n) + ")";
        auto stmtResult = db_.prepare(
            "SELECT from_unit_id, to_unit_id, kind, weight FROM memory_links WHERE bank_id = ? "
            "AND (from_unit_id IN " +
            list + " OR to_unit_id IN " + list + ") ORDER BY from_unit_id, to_unit_id, kind");
        if (!stmtResult)
            return stmtResult.error();
        auto& stmt = stmtResult.value();
        auto b = stmt.bind(1, bankId);
        for (size_t i = 0; b && i < n; ++i) {
            b = stmt.bind(static_cast<int>(i + 2), unitIds[offset + i]);
            if (b)
                b = stmt.bind(static_cast<int>(i + 2 + n), unitIds[offset + i]);
        }
        if (!b)
            return b.error();
        auto rows = collectRows(stmt, [&](const Statement& s) {
            auto kind = linkKindFromString(s.getString(2));
            if (!kind)
                return;
            out.push_back(MemoryLink{s.getString(0), s.getString(1), *kind, s.getDouble(3)});
        });
        if (!rows)
            return rows.error();
    }
    return out;
}

// ---------------------------------------------------------------------------
// Async operations
// ---------------------------------------------------------------------------

Result<void> MemorySession::insertOperation(const AsyncOperation& op) {
    auto stmtResult = db_.prepare(
        "INSERT INTO async_operations (id, bank_id, kind, state, payload, result, error, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(op.id, op.bankId, op.kind, operationStateToString(op.state), op.payload,
                          op.result, op.error, op.createdAt, op.updatedAt);
    if (!b)
        return b;
    return stmt.execute();
}

Result<std::optional<AsyncOperation>> MemorySession::getOperation(const std::string& bankId,
                                                                  const std::string& operationId) {
    auto stmtResult = db_.prepare(std::string("SELECT ") + kOperationColumns +
                                  " FROM async_operations WHERE bank_id = ? AND id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(bankId, operationId);
    if (!b)
        return b.error();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<AsyncOperation>{};
    return std::optional<AsyncOperation>{readOperation(stmt)};
}

Result<std::vector<AsyncOperation>>
MemorySession::listOperations(const std::string& bankId, std::optional<OperationState> state) {
    QueryBuilder qb;
    qb.select({kOperationColumns}).from("async_operations").where("bank_id = ?");
    std::vector<BindValue> binds{bankId};
    if (state) {
        qb.andWhere("state = ?");
        binds.emplace_back(std::string(operationStateToString(*state)));
    }
    qb.orderBy("created_at, id");

    auto stmtResult = db_.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = bindValues(stmt, binds);
    if (!b)
        return b.error();
    std::vector<AsyncOperation> out;
    auto rows = collectRows(stmt, [&](const Statement& s) { out.push_back(readOperation(s)); });
    if (!rows)
        return rows.error();
    return out;
}

Result<std::vector<AsyncOperation>> MemorySession::operationsInState(OperationState state) {
    auto stmtResult = db_.prepare(std::string("SELECT ") + kOperationColumns +
                                  " FROM async_operations WHERE state = ? ORDER BY created_at, id");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bind(1, operationStateToString(state));
    if (!b)
        return b.error();
    std::vector<AsyncOperation> out;
    auto rows = collectRows(stmt, [&](const Statement& s) { out.push_back(readOperation(s)); });
    if (!rows)
        return rows.error();
    return out;
}

Result<bool> MemorySession::transitionOperation(const std::string& operationId,
                                                OperationState from, OperationState to,
                                                const std::optional<std::string>& result,
                                                const std::optional<std::string>& error) {
    auto stmtResult = db_.prepare(
        "UPDATE async_operations SET state = ?, result = COALESCE(?, result), "
        "error = COALESCE(?, error), updated_at = ? WHERE id = ? AND state = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto& stmt = stmtResult.value();
    auto b = stmt.bindAll(operationStateToString(to), result, error,
                          std::chrono::system_clock::now(), operationId,
                          operationStateToString(from));
    if (!b)
        return b.error();
    auto ex = stmt.execute();
    if (!ex)
        return ex.error();
    return db_.changes() > 0;
}

} // namespace engram::metadata

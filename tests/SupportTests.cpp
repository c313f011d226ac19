#include <cmath>
#include <nlohmann/json.hpp>
#include "groundwork/Errors.hpp"
#include "groundwork/HashedTermEmbedder.hpp"
#include "groundwork/InMemoryVectorStore.hpp"
#include "groundwork/JsonCodec.hpp"
#include "groundwork/QueryPlanner.hpp"
#include "groundwork/ResultValidator.hpp"
#include "TestSupport.hpp"

using json = nlohmann::json;
using namespace groundwork;
using testsupport::expect;
using testsupport::meta;
using testsupport::near;

static SearchResult hit(const std::string& id, double similarity, const std::string& content,
                        const std::string& docId = "doc") {
    return SearchResult(id, content, meta(docId), 1.0 - similarity);
}

static void testTypes() {
    expect(parseQualityRating("Preferred") == QualityRating::Preferred, "quality names are case-insensitive");
    expect(parseQualityRating("gold") == QualityRating::Reference, "unknown quality falls back to reference");
    expect(std::string(toString(QualityRating::Supplemental)) == "supplemental", "quality names rendered lowercase");

    auto day = parseIsoDate("2024-03-01");
    auto stamp = parseIsoDate("2024-03-01T12:30:00Z");
    expect(day && stamp, "date forms parse");
    expect(std::chrono::duration_cast<std::chrono::minutes>(*stamp - *day).count() == 750, "time of day kept");
    expect(formatIsoDate(*stamp) == "2024-03-01T12:30:00", "dates formatted in UTC");
    expect(!parseIsoDate("yesterday") && !parseIsoDate(""), "garbage dates rejected");

    auto tags = parseTags(" Leadership, hiring ,,Ops ");
    expect(tags == std::vector<std::string>({"leadership", "hiring", "ops"}), "tags trimmed and lowercased");

    auto m = meta("d1", QualityRating::Preferred);
    m.format = "markdown";
    m.tags = {"ops"};
    MetadataFilter f;
    expect(f.empty() && f.matches(m), "empty filter matches everything");
    f.quality = QualityRating::Preferred;
    f.format = "markdown";
    expect(f.matches(m), "all clauses satisfied");
    f.tags = {"finance", "ops"};
    expect(f.matches(m), "tag clause is any-of");
    f.tags = {"finance"};
    expect(!f.matches(m) && !f.matchesTags(m), "missing tag excludes");
    f.tags.clear();
    f.format = "pdf";
    expect(!f.matches(m), "format mismatch excludes");
}

static void testEmbedderAndStore() {
    HashedTermEmbedder embedder(64);
    auto vectors = embedder.embed({"Kubernetes upgrade", "kubernetes UPGRADE", ""});
    expect(vectors.size() == 3 && vectors[0].size() == 64, "one vector per text");
    expect(vectors[0] == vectors[1], "embedding is deterministic and case-insensitive");
    double n = 0.0;
    for (float v : vectors[0]) n += static_cast<double>(v) * v;
    expect(near(n, 1.0, 1e-5), "embeddings are unit length");

    bool threw = false;
    try {
        HashedTermEmbedder bad(0);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "zero dimensions rejected");

    InMemoryVectorStore store("test");
    auto c1 = testsupport::chunk("c1", "kubernetes upgrade runbook", "ops");
    auto c2 = testsupport::chunk("c2", "quarterly budget review", "finance");
    c2.metadata.quality = QualityRating::Preferred;
    store.add(c1, embedder.embed({c1.content}).front());
    store.add(c2, embedder.embed({c2.content}).front());
    store.add(c1, embedder.embed({c1.content}).front());
    expect(store.count() == 2, "re-adding a chunk replaces it");

    auto hits = store.query(embedder.embed({"kubernetes upgrade runbook"}).front(), std::nullopt, 2);
    expect(hits.size() == 2 && hits[0].chunkId == "c1", "closest chunk first");
    expect(hits[0].distance < 1e-6 && hits[1].distance >= hits[0].distance, "distances ascending and non-negative");

    MetadataFilter preferred;
    preferred.quality = QualityRating::Preferred;
    auto filtered = store.query(embedder.embed({"kubernetes"}).front(), preferred, 5);
    expect(filtered.size() == 1 && filtered[0].chunkId == "c2", "store applies the quality clause");
    expect(store.query(embedder.embed({"x"}).front(), std::nullopt, 0).empty(), "n=0 returns nothing");
}

static void testResultValidator() {
    std::vector<SearchResult> results = {
        hit("strong", 0.8, "nothing relevant in here"),
        hit("hinted", 0.2, "our on call rotation covers weekends"),
        hit("weak", 0.2, "lunch menu"),
        hit("noise", 0.005, "on-call notes"),
    };
    auto v = validateSearchResults(results, {"on-call"});
    expect(v.accepted.size() == 2, "strong and keyword-matching results accepted");
    expect(v.accepted[0].chunkId == "strong" && v.accepted[1].chunkId == "hinted", "input order kept");
    expect(v.warnings.size() == 2, "one warning per rejected result");
    expect(v.warnings[0].rfind("Insufficient keyword matches (0/1) in: lunch menu", 0) == 0, "keyword warning");
    expect(v.warnings[1].rfind("Low similarity (0.005)", 0) == 0, "similarity warning");

    expect(countKeywordMatches("Incident Response playbook", {"incident", "RESPONSE", "pager"}) == 2,
           "matches are case-insensitive");
    expect(countKeywordMatches("the call rotation is on monday", {"on-call"}) == 1, "hyphen parts match");
    expect(countKeywordMatches("the rotation", {"on-call", ""}) == 0, "missing part does not match");
}

static void testQueryPlanner() {
    auto queries = buildSearchQueries("Remote Teams", {"remote", "teams", "async"}, "Distributed teams need written culture");
    expect(queries.size() == 4, "title, keyword, thesis and keyword-only queries");
    expect(queries[0] == "Remote Teams" && queries[1] == "Remote Teams remote teams", "title queries first");
    expect(queries[3] == "remote teams async", "keyword-only query");

    auto dedup = buildSearchQueries("ops", {}, "");
    expect(dedup == std::vector<std::string>({"ops"}), "title alone when nothing else applies");
    auto pair = buildSearchQueries("Ops", {"ops", "ops"});
    expect(pair.size() == 3 && pair[2] == "ops ops practices", "two keywords add a practices query");

    int calls = 0;
    auto results = collectUniqueResults({"a", " ", "b"}, [&](const std::string& q, std::size_t n) {
        ++calls;
        expect(n == 3, "three results per query");
        return std::vector<SearchResult>{hit("shared", 0.5, "x"), hit("only-" + q, 0.4, "y")};
    });
    expect(calls == 2, "blank queries skipped");
    expect(results.size() == 3 && results[0].chunkId == "shared" && results[2].chunkId == "only-b",
           "first occurrence of each chunk kept");

    std::vector<SearchResult> material = {
        hit("h", 0.5, "intro line\n## Hiring Loops\nbody text"),
        hit("q", 0.5, "[link]\n> quote\nPlain first line\nmore"),
        hit("e", 0.5, "\n\n"),
        hit("long", 0.5, std::string(200, 'a')),
    };
    auto sections = sectionsFromResults(material, 3);
    expect(sections.size() == 3, "capped at max sections");
    expect(sections[0].title == "Hiring Loops", "heading becomes the title");
    expect(sections[1].title == "Plain first line", "link and quote lines skipped");
    expect(sections[2].title == "Untitled Section", "blank content has no title");
    auto longSection = sectionsFromResults({material[3]}, 5);
    expect(longSection[0].title.size() == 80, "titles capped");
    expect(longSection[0].description == std::string(100, 'a') + "...", "descriptions truncated");
    expect(sectionsFromResults(material, 5)[0].coveragePct == 0.0, "derived sections start unanalyzed");
}

static void testJsonCodec() {
    auto c = json::parse(R"({
        "id": "c1",
        "content": "text",
        "metadata": {
            "document_id": "doc-7",
            "quality_rating": "preferred",
            "tags": "Ops, Hiring",
            "created_date": "2023-05-01",
            "modified_date": "not a date"
        }
    })").get<Chunk>();
    expect(c.documentId == "doc-7", "document id taken from metadata");
    expect(c.metadata.quality == QualityRating::Preferred, "quality parsed");
    expect(c.metadata.tags == std::vector<std::string>({"ops", "hiring"}), "comma tags parsed");
    expect(c.metadata.createdDate.has_value() && !c.metadata.modifiedDate, "bad dates treated as missing");

    json j = c;
    expect(j["metadata"]["created_date"] == "2023-05-01T00:00:00", "dates written in ISO form");
    expect(j["metadata"]["modified_date"].is_null(), "missing dates written as null");

    auto f = json{{"quality_rating", "deprecated"}, {"tags", {"ops"}}}.get<MetadataFilter>();
    expect(f.quality == QualityRating::Deprecated && !f.format && f.tags.size() == 1, "filter parsed");

    SearchResult r("c1", "text", c.metadata, 0.25);
    r.hybridScore = 0.6;
    json rj = r;
    expect(rj["similarity_score"] == 0.75 && rj["hybrid_score"] == 0.6, "scores serialized");
    expect(rj["combined_score"].is_null(), "unset scores are null");

    auto o = json::parse(R"({
        "title": "Ops",
        "keywords": ["ops"],
        "sections": [
            {"title": "A", "coverage_pct": 40.0, "subsections": [{"title": "A.1", "coverage_pct": 80.0}]}
        ]
    })").get<Outline>();
    expect(o.sectionCount == 2 && near(o.avgCoverage, 60.0), "outline stats computed on load");
    expect(o.sections[0].subsections[0].title == "A.1", "nested sections parsed");
    json oj = o;
    expect(oj["sections"][0]["subsections"][0]["coverage_pct"] == 80.0, "outline written back");
}

int main() {
    testTypes();
    testEmbedderAndStore();
    testResultValidator();
    testQueryPlanner();
    testJsonCodec();
    std::cout << "All tests passed." << std::endl;
    return 0;
}

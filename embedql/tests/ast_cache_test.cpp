// AST cache tests

#include "cache/ast_cache.hpp"
#include "module/source_module_parser.hpp"
#include "test_doubles.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace embedql;
using namespace embedql::cache;
using embedql::test_support::CountingDocumentParser;
using embedql::test_support::MemoryFileSystem;

namespace {

graphql::Document document_named(const std::string& name) {
    graphql::FragmentDefinition frag;
    frag.name = name;
    frag.type_condition = "T";
    graphql::Document doc;
    doc.definitions.push_back(graphql::Definition{std::move(frag)});
    return doc;
}

void wait_until(const std::function<bool()>& ready) {
    while (!ready()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

/// Returns the scripted texts one read at a time; the last one repeats.
class ScriptedFileSystem : public source::FileSystem {
public:
    explicit ScriptedFileSystem(std::vector<std::string> texts) : texts_(std::move(texts)) {}

    auto read_text(const std::string& /*base_dir*/, const std::string& /*rel_path*/)
        -> Result<std::string, Error> override {
        std::lock_guard lock(mutex_);
        std::string text = texts_[std::min(next_, texts_.size() - 1)];
        ++next_;
        return text;
    }

    auto exists(const std::string& /*base_dir*/, const std::string& /*rel_path*/)
        -> bool override {
        return true;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> texts_;
    size_t next_ = 0;
};

} // namespace

// ============================================================================
// Through the source module parser
// ============================================================================

class AstCacheTest : public ::testing::Test {
protected:
    Rc<MemoryFileSystem> files = make_rc<MemoryFileSystem>();
    Rc<CountingDocumentParser> document_parser = make_rc<CountingDocumentParser>();
    module::SourceModuleParser parser{extract::make_tag_extractor("javascript"), document_parser,
                                      files, make_rc<extract::ExtractionCache>()};
    Box<AstCache> cache = parser.make_ast_cache("/project");
};

TEST_F(AstCacheTest, SecondGetIsAHit) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");

    auto first = cache->get({"src/Foo.js"});
    auto second = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), unwrap(second));
    EXPECT_EQ(document_parser->calls.load(), 1);

    auto stats = cache->get_stats();
    EXPECT_EQ(stats.total_entries, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.parses, 1u);
}

TEST_F(AstCacheTest, ChangedContentIsReparsed) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");
    auto before = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(before));

    files->set("src/Foo.js", "graphql`query FooOtherQuery { id }`");
    auto after = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(after));

    EXPECT_NE(unwrap(before), unwrap(after));
    EXPECT_EQ(unwrap(after)->definition_names(), std::vector<std::string>{"FooOtherQuery"});
    // Earlier callers keep their snapshot
    EXPECT_EQ(unwrap(before)->definition_names(), std::vector<std::string>{"FooQuery"});
    EXPECT_EQ(cache->get_stats().total_entries, 1u);
}

TEST_F(AstCacheTest, SuppliedHashIsTrusted) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");
    source::File file{"src/Foo.js", source::signature_of("revision 1")};
    auto first = cache->get(file);
    ASSERT_TRUE(is_ok(first));

    // Same hash: content is not looked at again
    files->set("src/Foo.js", "graphql`query FooOtherQuery { id }`");
    auto same = cache->get(file);
    ASSERT_TRUE(is_ok(same));
    EXPECT_EQ(unwrap(same), unwrap(first));

    file.hash = source::signature_of("revision 2");
    auto next = cache->get(file);
    ASSERT_TRUE(is_ok(next));
    EXPECT_EQ(unwrap(next)->definition_names(), std::vector<std::string>{"FooOtherQuery"});
    EXPECT_EQ(document_parser->calls.load(), 2);
}

TEST_F(AstCacheTest, FailureDoesNotPoisonTheEntry) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");
    auto good = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(good));

    files->set("src/Foo.js", "graphql`query FooQuery {`");
    auto bad = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, ErrorKind::MalformedLiteral);

    // The last good document stays stored
    auto docs = cache->documents();
    ASSERT_EQ(docs.count("src/Foo.js"), 1u);
    EXPECT_EQ(docs["src/Foo.js"], unwrap(good));
    EXPECT_EQ(cache->get_stats().failures, 1u);

    // A failed revision is retried, not remembered
    auto again = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(cache->get_stats().failures, 2u);

    files->set("src/Foo.js", "graphql`query FooQuery { id name }`");
    auto fixed = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(fixed));
    EXPECT_NE(unwrap(fixed), unwrap(good));
}

TEST_F(AstCacheTest, SourcesAreStoredWithTheDocument) {
    files->set("src/Foo.js", "graphql`fragment Foo_a on T { a }`;\n"
                             "graphql`query FooQuery { id }`;\n");
    ASSERT_TRUE(is_ok(cache->get({"src/Foo.js"})));

    EXPECT_EQ(cache->sources("src/Foo.js"),
              (std::vector<std::string>{"fragment Foo_a on T { a }", "query FooQuery { id }"}));
    EXPECT_TRUE(cache->sources("src/Other.js").empty());

    cache->evict("src/Foo.js");
    EXPECT_TRUE(cache->sources("src/Foo.js").empty());
}

TEST_F(AstCacheTest, ParseTimeIsRecordedOnMisses) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");
    document_parser->delay = std::chrono::milliseconds(20);

    ASSERT_TRUE(is_ok(cache->get({"src/Foo.js"})));
    auto after_miss = cache->get_stats().parse_time_us;
    EXPECT_GE(after_miss, 20000u);

    // Hits do not add time
    ASSERT_TRUE(is_ok(cache->get({"src/Foo.js"})));
    EXPECT_EQ(cache->get_stats().parse_time_us, after_miss);

    auto timing = parser.parse_stats();
    EXPECT_EQ(timing.calls, 1u);
    EXPECT_GE(timing.total_time_us, 20000u);
    EXPECT_EQ(timing.max_time_us, timing.total_time_us);

    cache->clear();
    EXPECT_EQ(cache->get_stats().parse_time_us, 0u);
}

TEST_F(AstCacheTest, MissingFileIsAnIoError) {
    auto result = cache->get({"src/Gone.js"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::IO);
    EXPECT_EQ(document_parser->calls.load(), 0);
}

TEST_F(AstCacheTest, ConcurrentGetsParseOnce) {
    files->set("src/Foo.js", "graphql`query FooQuery { id }`");
    document_parser->delay = std::chrono::milliseconds(100);

    const int num_threads = 8;
    std::vector<DocumentPtr> results(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            auto doc = cache->get({"src/Foo.js"});
            if (is_ok(doc)) {
                results[t] = unwrap(doc);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_NE(results[0], nullptr);
    for (int t = 1; t < num_threads; ++t) {
        EXPECT_EQ(results[t], results[0]);
    }
    EXPECT_EQ(document_parser->calls.load(), 1);
    EXPECT_EQ(cache->get_stats().parses, 1u);
}

TEST(AstCacheRevisionTest, SaveBetweenReadsIsStoredUnderTheParsedText) {
    const std::string old_text = "graphql`query FooOldQuery { id }`";
    const std::string new_text = "graphql`query FooNewQuery { id }`";
    // Reads alternate: signature, parse, signature, parse, ...
    auto files = make_rc<ScriptedFileSystem>(
        std::vector<std::string>{old_text, new_text, old_text, old_text});
    module::SourceModuleParser parser(extract::make_tag_extractor("javascript"),
                                      make_rc<graphql::GraphQLDocumentParser>(), files,
                                      make_rc<extract::ExtractionCache>());
    auto cache = parser.make_ast_cache("/project");

    // Saved between the two reads: the caller gets what was parsed
    auto first = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first)->definition_names(), std::vector<std::string>{"FooNewQuery"});

    // Back at the old text, which was never parsed
    auto second = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second)->definition_names(), std::vector<std::string>{"FooOldQuery"});
    EXPECT_EQ(cache->get_stats().parses, 2u);

    auto third = cache->get({"src/Foo.js"});
    ASSERT_TRUE(is_ok(third));
    EXPECT_EQ(unwrap(third), unwrap(second));
    EXPECT_EQ(cache->get_stats().parses, 2u);
}

// ============================================================================
// Batch Parsing
// ============================================================================

TEST_F(AstCacheTest, ParseFilesReturnsEveryDocument) {
    files->set("src/A.js", "graphql`query AQuery { id }`");
    files->set("src/B.js", "graphql`fragment B_x on T { x }`");

    auto result = cache->parse_files({{"src/A.js"}, {"src/B.js"}});
    ASSERT_TRUE(is_ok(result));
    const auto& docs = unwrap(result);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs.at("src/A.js")->definition_names(), std::vector<std::string>{"AQuery"});
    EXPECT_EQ(docs.at("src/B.js")->definition_names(), std::vector<std::string>{"B_x"});
}

TEST_F(AstCacheTest, ParseFilesEvictsDeletedFiles) {
    files->set("src/A.js", "graphql`query AQuery { id }`");
    files->set("src/B.js", "graphql`fragment B_x on T { x }`");
    ASSERT_TRUE(is_ok(cache->parse_files({{"src/A.js"}, {"src/B.js"}})));

    files->remove("src/B.js");
    source::File deleted{"src/B.js"};
    deleted.exists = false;
    auto result = cache->parse_files({{"src/A.js"}, deleted});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).size(), 1u);
    EXPECT_EQ(unwrap(result).count("src/B.js"), 0u);
    EXPECT_EQ(document_parser->calls.load(), 2);
}

TEST_F(AstCacheTest, ParseFilesWrapsFirstError) {
    files->set("src/A.js", "graphql`query AQuery { id }`");
    files->set("src/B.js", "graphql``");
    files->set("src/C.js", "graphql`query CQuery {`");

    auto result = cache->parse_files({{"src/A.js"}, {"src/B.js"}, {"src/C.js"}});
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::MalformedLiteral);
    EXPECT_EQ(err.file, "src/B.js");
    EXPECT_EQ(err.message.rfind("Parse error: Expected GraphQL text", 0), 0u);
    EXPECT_NE(err.message.find("in \"src/B.js\""), std::string::npos);

    // Files parsed before the failure stay cached
    EXPECT_EQ(cache->documents().count("src/A.js"), 1u);
}

TEST_F(AstCacheTest, ParallelMatchesSequential) {
    std::vector<source::File> batch;
    for (int i = 0; i < 20; ++i) {
        std::string name = "M" + std::to_string(i);
        std::string path = "src/" + name + ".js";
        files->set(path, "graphql`query " + name + "Query { id }`");
        batch.push_back({path});
    }

    auto result = cache->parse_files_parallel(batch, 4);
    ASSERT_TRUE(is_ok(result));
    const auto& docs = unwrap(result);
    ASSERT_EQ(docs.size(), 20u);
    for (const auto& file : batch) {
        ASSERT_EQ(docs.count(file.rel_path), 1u);
    }
    EXPECT_EQ(docs.at("src/M7.js")->definition_names(), std::vector<std::string>{"M7Query"});
    EXPECT_EQ(document_parser->calls.load(), 20);

    // Second run is all hits
    ASSERT_TRUE(is_ok(cache->parse_files_parallel(batch, 0)));
    EXPECT_EQ(document_parser->calls.load(), 20);
}

TEST_F(AstCacheTest, ParallelReportsFirstErrorInInputOrder) {
    std::vector<source::File> batch;
    for (int i = 0; i < 12; ++i) {
        std::string name = "M" + std::to_string(i);
        std::string path = "src/" + name + ".js";
        bool broken = i == 3 || i == 9;
        files->set(path, broken ? "graphql`query " + name + "Query {`"
                                : "graphql`query " + name + "Query { id }`");
        batch.push_back({path});
    }

    for (size_t jobs : {1u, 3u, 8u}) {
        cache->clear();
        auto result = cache->parse_files_parallel(batch, jobs);
        ASSERT_TRUE(is_err(result)) << "jobs=" << jobs;
        EXPECT_EQ(unwrap_err(result).file, "src/M3.js") << "jobs=" << jobs;
    }
}

TEST(AstCacheParallelTest, ExceptionIsRethrownOnTheCallingThread) {
    AstCache cache(
        "/project",
        [](const std::string&, const source::File& file) -> Result<ParsedRevision, Error> {
            if (file.rel_path == "src/B.js") {
                throw std::runtime_error("grammar parser crashed");
            }
            return ParsedRevision{document_named("A"), {}, source::signature_of(file.rel_path)};
        },
        [](const std::string&, const source::File& file) -> Result<source::ContentSignature, Error> {
            return source::signature_of(file.rel_path);
        });

    std::vector<source::File> batch{{"src/A.js"}, {"src/B.js"}, {"src/C.js"}};
    EXPECT_THROW((void)cache.parse_files_parallel(batch, 2), std::runtime_error);
    EXPECT_EQ(cache.documents().count("src/A.js"), 1u);
}

TEST_F(AstCacheTest, EvictAndClear) {
    files->set("src/A.js", "graphql`query AQuery { id }`");
    ASSERT_TRUE(is_ok(cache->get({"src/A.js"})));

    cache->evict("src/A.js");
    EXPECT_TRUE(cache->documents().empty());

    ASSERT_TRUE(is_ok(cache->get({"src/A.js"})));
    EXPECT_EQ(document_parser->calls.load(), 2);

    cache->clear();
    auto stats = cache->get_stats();
    EXPECT_EQ(stats.total_entries, 0u);
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.parses, 0u);
    EXPECT_EQ(cache->base_dir(), "/project");
}

// ============================================================================
// Single Flight
// ============================================================================

class AstCacheFlightTest : public ::testing::Test {
protected:
    std::atomic<int> parses{0};
    const int num_threads = 6;
};

TEST_F(AstCacheFlightTest, ConcurrentFailureIsSharedByAllCallers) {
    Rc<AstCache> cache;
    cache = make_rc<AstCache>(
        "/project",
        [&](const std::string&, const source::File&) -> Result<ParsedRevision, Error> {
            parses.fetch_add(1);
            // Let every caller register its miss and join this flight
            wait_until([&] { return cache->get_stats().misses >= size_t(num_threads); });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return Error::malformed("Syntax Error: Unexpected <EOF>.", "src/Foo.js");
        },
        [](const std::string&, const source::File&) -> Result<source::ContentSignature, Error> {
            return source::signature_of("v1");
        });

    std::vector<std::string> messages(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            auto result = cache->get({"src/Foo.js"});
            messages[t] = is_err(result) ? unwrap_err(result).message : "ok";
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& message : messages) {
        EXPECT_EQ(message, "Syntax Error: Unexpected <EOF>.");
    }
    EXPECT_EQ(parses.load(), 1);
    EXPECT_EQ(cache->get_stats().failures, 1u);
    EXPECT_TRUE(cache->documents().empty());
}

TEST_F(AstCacheFlightTest, ThrowingParseReachesEveryCaller) {
    Rc<AstCache> cache;
    cache = make_rc<AstCache>(
        "/project",
        [&](const std::string&, const source::File&) -> Result<ParsedRevision, Error> {
            parses.fetch_add(1);
            wait_until([&] { return cache->get_stats().misses >= size_t(num_threads); });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            throw std::runtime_error("grammar parser crashed");
        },
        [](const std::string&, const source::File&) -> Result<source::ContentSignature, Error> {
            return source::signature_of("v1");
        });

    std::vector<std::string> messages(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            try {
                (void)cache->get({"src/Foo.js"});
                messages[t] = "returned";
            } catch (const std::exception& e) {
                messages[t] = e.what();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& message : messages) {
        EXPECT_EQ(message, "grammar parser crashed");
    }
    EXPECT_EQ(parses.load(), 1);
    EXPECT_TRUE(cache->documents().empty());
}

TEST_F(AstCacheFlightTest, WaiterOnOtherRevisionRetries) {
    const auto v1 = source::signature_of("v1");
    const auto v2 = source::signature_of("v2");

    Rc<AstCache> cache;
    cache = make_rc<AstCache>(
        "/project",
        [&](const std::string&, const source::File& file) -> Result<ParsedRevision, Error> {
            parses.fetch_add(1);
            if (*file.hash == v1) {
                // Hold the first revision until the second caller has missed
                wait_until([&] { return cache->get_stats().misses >= 2; });
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return ParsedRevision{document_named("One"), {}, v1};
            }
            return ParsedRevision{document_named("Two"), {}, v2};
        },
        [](const std::string&, const source::File& file) -> Result<source::ContentSignature, Error> {
            return *file.hash;
        });

    DocumentPtr first;
    std::thread old_revision([&] {
        auto result = cache->get({"src/Foo.js", v1});
        if (is_ok(result)) {
            first = unwrap(result);
        }
    });
    wait_until([&] { return parses.load() == 1; });

    auto second = cache->get({"src/Foo.js", v2});
    old_revision.join();

    ASSERT_TRUE(is_ok(second));
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->definition_names(), std::vector<std::string>{"One"});
    EXPECT_EQ(unwrap(second)->definition_names(), std::vector<std::string>{"Two"});
    EXPECT_EQ(parses.load(), 2);

    // The newer revision is what stays stored
    EXPECT_EQ(cache->documents().at("src/Foo.js"), unwrap(second));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(AstCacheHelperTest, WrapKeepsKindAndExistingFile) {
    auto wrapped = wrap_parse_error(Error::extraction("bad name", "src/Other.js"), "src/Foo.js");
    EXPECT_EQ(wrapped.kind, ErrorKind::Extraction);
    EXPECT_EQ(wrapped.file, "src/Other.js");
    EXPECT_EQ(wrapped.message, "Parse error: bad name in \"src/Foo.js\"");

    auto filled = wrap_parse_error(Error::precondition("oops"), "src/Foo.js");
    EXPECT_EQ(filled.file, "src/Foo.js");
}

TEST(AstCacheHelperTest, SignatureFallsBackToContent) {
    auto files = make_rc<MemoryFileSystem>();
    files->set("a.js", "graphql`query AQuery { id }`");
    auto signature = hash_or_content_signature(files);

    auto from_content = signature("/project", {"a.js"});
    ASSERT_TRUE(is_ok(from_content));
    EXPECT_EQ(unwrap(from_content), source::signature_of("graphql`query AQuery { id }`"));

    auto hash = source::signature_of("precomputed");
    auto from_hash = signature("/project", {"a.js", hash});
    ASSERT_TRUE(is_ok(from_hash));
    EXPECT_EQ(unwrap(from_hash), hash);
    EXPECT_EQ(files->reads.load(), 1);

    auto missing = signature("/project", {"b.js"});
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, ErrorKind::IO);
}

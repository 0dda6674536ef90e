/**
 * Simple image similarity search example using Vista
 *
 * This example demonstrates:
 * - Creating a collection
 * - Adding labelled embeddings
 * - Performing similarity search with and without a metadata filter
 * - Saving and reopening the collection
 */

#include <vista/collection.hpp>
#include <vista/eval/retrieval_eval.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Embedding near one of a few class prototypes
std::vector<float> generate_embedding(std::size_t dim, std::size_t label, std::mt19937& gen) {
    std::normal_distribution<float> noise(0.0f, 0.1f);
    std::vector<float> vec(dim, 0.0f);
    for (std::size_t d = 0; d < dim; ++d) {
        vec[d] = (d % 4 == label ? 1.0f : 0.0f) + noise(gen);
    }
    return vec;
}

int main() {
    using namespace vista;

    const std::size_t dimension = 64;
    const char* labels[] = {"cat", "dog", "car", "tree"};

    collection_config config;
    config.dimension = dimension;
    config.metric = Metric::Cosine;
    config.index.strategy = index::IndexStrategy::Partitioned;
    config.index.num_partitions = 8;
    config.index.probe_count = 3;
    apply_env_overrides(config);

    auto coll = collection::create(config);
    if (!coll) {
        std::cerr << "Failed to create collection: " << coll.error().message << std::endl;
        return 1;
    }

    // Add 1000 embeddings, 250 per label
    std::mt19937 gen(42);
    for (std::size_t i = 0; i < 1000; ++i) {
        char id[32];
        std::snprintf(id, sizeof(id), "images/%04zu.jpg", i);
        const std::size_t label = i % 4;
        auto ok = coll->insert(id, generate_embedding(dimension, label, gen),
                               {{"label", std::string(labels[label])}});
        if (!ok) {
            std::cerr << "Insert failed: " << ok.error().message << std::endl;
            return 1;
        }
    }

    if (!coll->wait_until_clean(std::chrono::seconds(10))) {
        std::cerr << "Index did not catch up in time" << std::endl;
        return 1;
    }
    std::cout << "Indexed " << coll->size() << " images" << std::endl;

    // Search
    const auto query = generate_embedding(dimension, 1, gen);
    auto results = coll->query(query, 5);
    if (!results) {
        std::cerr << "Search failed: " << results.error().message << std::endl;
        return 1;
    }
    std::cout << "\nTop 5 similar images:" << std::endl;
    for (const auto& hit : *results) {
        const auto rec = coll->get(hit.id);
        std::cout << "  " << hit.id << " distance=" << hit.distance;
        if (rec) std::cout << " label=" << std::get<std::string>(rec->metadata.at("label"));
        std::cout << std::endl;
    }

    // Filtered search
    query::QueryOptions only_cats;
    only_cats.filter = [](const Record& r) {
        const auto it = r.metadata.find("label");
        return it != r.metadata.end() && it->second == MetadataValue{std::string("cat")};
    };
    auto cats = coll->query(query, 3, only_cats);
    if (cats) {
        std::cout << "\nClosest cats:" << std::endl;
        for (const auto& hit : *cats) std::cout << "  " << hit.id << " distance=" << hit.distance << std::endl;
    }

    // Retrieval quality on a few held-in queries
    std::vector<eval::LabelledQuery> queries;
    for (std::size_t i = 0; i < 40; ++i) {
        char id[32];
        std::snprintf(id, sizeof(id), "images/%04zu.jpg", i);
        const auto rec = coll->get(id);
        if (rec) queries.push_back({rec->vector, rec->metadata.at("label"), std::string(id)});
    }
    const std::vector<std::uint32_t> cutoffs{1, 10};
    if (auto m = eval::evaluate_retrieval(*coll, queries, cutoffs, "label")) {
        std::cout << "\nP@10=" << m->precision.back() << " R@1=" << m->recall.front()
                  << " mAP@10=" << m->mean_average_precision << std::endl;
    }

    // Persist and reopen
    const auto path = std::filesystem::temp_directory_path() / "vista_simple_search.vsnp";
    if (auto saved = coll->save(path); !saved) {
        std::cerr << "Save failed: " << saved.error().message << std::endl;
        return 1;
    }
    auto reopened = collection::open(path);
    if (!reopened) {
        std::cerr << "Open failed: " << reopened.error().message << std::endl;
        return 1;
    }
    std::cout << "\nReopened collection with " << reopened->size() << " images" << std::endl;
    std::filesystem::remove(path);

    return 0;
}

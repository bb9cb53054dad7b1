#include <algorithm>
#include <iostream>
#include <vector>

#include "robin_hood.h"
#include "api.hpp"
#include "graph/countgraph.hpp"
#include "graph/tagging.hpp"
#include "partition/claim_map.hpp"
#include "partition/neighborhood.hpp"
#include "test_utils.hpp"

robin_hood::unordered_flat_set<uint64_t> distinct_kmers(const KmerCodec &codec,
                                                      const std::string &seq)
{
    robin_hood::unordered_flat_set<uint64_t> kmers;
    KmerIterator kmer_it(codec, seq);
    while (kmer_it.next()) {
        kmers.insert(kmer_it.key());
    }
    return kmers;
}

// Checks no k-mer is in two neighborhoods and returns how many were claimed
size_t check_disjoint(const std::vector<Neighborhood>& nbhds)
{
    robin_hood::unordered_flat_set<uint64_t> claimed;
    for (auto nbhd_it = nbhds.cbegin(); nbhd_it != nbhds.cend(); ++nbhd_it) {
        check(!nbhd_it->empty() && nbhd_it->kmers[0] == nbhd_it->tag,
              "neighborhood starts from its tag");
        for (auto kmer_it = nbhd_it->kmers.cbegin();
             kmer_it != nbhd_it->kmers.cend(); ++kmer_it) {
            check(claimed.insert(*kmer_it).second, "k-mer claimed twice");
        }
    }
    return claimed.size();
}

TagSet consume_all(CountGraph& graph, const std::vector<std::string>& seqs,
                   const size_t density)
{
    TagSet tags;
    for (auto seq_it = seqs.cbegin(); seq_it != seqs.cend(); ++seq_it) {
        std::vector<uint64_t> seq_tags;
        graph.consume_and_tag(*seq_it, density, seq_tags);
        tags.add(seq_tags);
    }
    return tags;
}

int main (int argc, char* argv[])
{
    // ClaimMap
    ClaimMap claims(4);
    check(claims.owner(12) == ClaimMap::unclaimed, "starts empty");
    check(claims.try_claim(12, 0), "first claim succeeds");
    check(!claims.try_claim(12, 1), "second claim fails");
    check(claims.owner(12) == 0 && claims.is_claimed(12), "first owner kept");
    check(claims.try_claim(13, 1) && claims.size() == 2, "independent keys");
    std::cout << "Claim map OK" << std::endl;

    // One path component: the first tag takes all of it
    const std::string seq = random_sequence(600, 11);
    CountGraph graph(21, Alphabet::DNA, 1000003, 2);
    TagSet tags = consume_all(graph, {seq}, 100);
    check(tags.size() == 6, "580 k-mers at density 100");
    const size_t n_distinct = distinct_kmers(graph.codec(), seq).size();

    TraversalBounds open_bounds = {1000, 100000, 0};
    std::vector<Neighborhood> whole =
        partition_neighborhoods(graph, tags, open_bounds, 1);
    check(whole.size() == 1, "later tags already claimed");
    check(whole[0].tag == tags.tags()[0], "first tag wins");
    check(whole[0].size() == n_distinct && !whole[0].partial,
          "whole component covered");
    check_disjoint(whole);

    // Radius limits each tag to its stretch of the path
    TraversalBounds near_bounds = {default_radius(100), 100000, 0};
    std::vector<Neighborhood> local =
        partition_neighborhoods(graph, tags, near_bounds, 1);
    check(local.size() == 6, "one neighborhood per tag");
    check(check_disjoint(local) == n_distinct, "every k-mer claimed once");
    const uint64_t before_tag = graph.codec().encode(seq.substr(99, 21));
    bool in_first = false;
    for (auto kmer_it = local[0].kmers.cbegin(); kmer_it != local[0].kmers.cend(); ++kmer_it) {
        in_first = in_first || *kmer_it == before_tag;
    }
    check(in_first, "node next to a later tag goes to the earlier one");
    check(local[1].tag == graph.codec().encode(seq.substr(100, 21)),
          "second tag starts its own neighborhood");
    std::cout << "Partition coverage OK" << std::endl;

    // Default radius reaches the end of a sequence whose k-mer count is not
    // a multiple of the density
    for (size_t density : {100, 200, 7}) {
        const std::string odd_seq = random_sequence(411, 40 + density);
        CountGraph odd_graph(32, Alphabet::DNA, 1000003, 2);
        TagSet odd_tags = consume_all(odd_graph, {odd_seq}, density);
        BuildParams odd_params;
        odd_params.tag_density = density;
        std::vector<Neighborhood> odd_nbhds = partition_neighborhoods(
            odd_graph, odd_tags, traversal_bounds(odd_params), 2);
        check(odd_nbhds.size() == odd_tags.size(), "every tag emits a neighborhood");
        check(check_disjoint(odd_nbhds) ==
                  distinct_kmers(odd_graph.codec(), odd_seq).size(),
              "all 380 k-mers claimed");
        const uint64_t last_kmer = odd_graph.codec().encode(odd_seq.substr(411 - 32, 32));
        check(std::find(odd_nbhds.back().kmers.cbegin(), odd_nbhds.back().kmers.cend(),
                        last_kmer) != odd_nbhds.back().kmers.cend(),
              "last k-mer in the last neighborhood");
    }

    // Short sequence: its single tag covers all of it
    const std::string short_seq = random_sequence(80, 45);
    CountGraph short_graph(32, Alphabet::DNA, 1000003, 2);
    TagSet short_tags = consume_all(short_graph, {short_seq}, 200);
    BuildParams short_params;
    std::vector<Neighborhood> short_nbhds = partition_neighborhoods(
        short_graph, short_tags, traversal_bounds(short_params), 1);
    check(short_tags.size() == 1 && short_nbhds.size() == 1 &&
          short_nbhds[0].size() == 49, "short sequence wholly covered");
    std::cout << "Default radius OK" << std::endl;

    // Size cap
    TraversalBounds capped_bounds = {1000, 10, 0};
    std::vector<Neighborhood> capped =
        partition_neighborhoods(graph, tags, capped_bounds, 1);
    check(!capped.empty(), "capped neighborhoods produced");
    for (auto nbhd_it = capped.cbegin(); nbhd_it != capped.cend(); ++nbhd_it) {
        check(nbhd_it->size() <= 10, "size cap respected");
    }
    check(capped[0].size() == 10 && capped[0].partial, "truncation flagged");
    check_disjoint(capped);

    std::vector<uint64_t> region;
    check(traverse_from_tag(graph, tags.tags()[0], capped_bounds, nullptr, region),
          "traversal reports truncation");
    ClaimMap tag_claimed;
    tag_claimed.try_claim(tags.tags()[0], 0);
    check(!traverse_from_tag(graph, tags.tags()[0], open_bounds, &tag_claimed, region)
          && region.empty(), "claimed tag gives an empty region");
    std::cout << "Size cap OK" << std::endl;

    // Abundance threshold
    const std::string common = random_sequence(300, 21);
    const std::string rare = random_sequence(300, 22);
    CountGraph abund_graph(21, Alphabet::DNA, 1000003, 2);
    TagSet abund_tags = consume_all(abund_graph, {common, rare}, 100);
    abund_graph.consume(common);
    abund_graph.consume(common);
    TraversalBounds abund_bounds = {1000, 100000, 1};
    std::vector<Neighborhood> abundant =
        partition_neighborhoods(abund_graph, abund_tags, abund_bounds, 1);
    check(abundant.size() == 1, "tags of rare sequence skipped");
    check(abundant[0].size() == distinct_kmers(abund_graph.codec(), common).size(),
          "only abundant k-mers entered");
    std::cout << "Abundance threshold OK" << std::endl;

    // Overlapping reads give conflicting speculative traversals; the
    // result must not depend on the number of threads
    const std::string genome = random_sequence(5000, 31);
    std::vector<std::string> reads;
    for (size_t start = 0; start + 400 <= genome.size(); start += 137) {
        reads.push_back(genome.substr(start, 400));
    }
    reads.push_back(random_sequence(2000, 32));
    CountGraph read_graph(21, Alphabet::DNA, 1000003, 2);
    TagSet read_tags = consume_all(read_graph, reads, 40);

    for (size_t max_size : {50, 100000}) {
        TraversalBounds read_bounds = {30, max_size, 0};
        std::vector<Neighborhood> serial =
            partition_neighborhoods(read_graph, read_tags, read_bounds, 1);
        for (size_t block_size : {1, 3, 1000}) {
            std::vector<Neighborhood> threaded = partition_neighborhoods(
                read_graph, read_tags, read_bounds, 4, block_size);
            check(serial.size() == threaded.size(), "same number of neighborhoods");
            for (size_t i = 0; i < serial.size(); i++) {
                check(serial[i].tag == threaded[i].tag &&
                      serial[i].kmers == threaded[i].kmers &&
                      serial[i].partial == threaded[i].partial,
                      "same neighborhoods whatever the threads and blocks");
            }
            check_disjoint(threaded);
        }
    }
    std::cout << "Threaded partition OK" << std::endl;

    return 0;
}

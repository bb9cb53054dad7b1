#include <algorithm>
#include <iostream>
#include <vector>

#include "partition/neighborhood.hpp"
#include "sketch/minhash.hpp"
#include "test_utils.hpp"

Neighborhood make_neighborhood(const uint64_t first, const uint64_t n)
{
    Neighborhood nbhd;
    nbhd.tag = first;
    nbhd.partial = false;
    for (uint64_t key = first; key < first + n; key++) {
        nbhd.kmers.push_back(key);
    }
    return nbhd;
}

int main (int argc, char* argv[])
{
    const size_t N = def_sketch_size;

    // Size bound
    NbhdSketch small = sketch_neighborhood(make_neighborhood(0, 5), N, def_hash_modulus);
    check(small.size() == 5 && small.undersized(N), "small neighborhood hashed whole");
    check(small.n_kmers() == 5 && small.tag() == 0, "sketch metadata");
    NbhdSketch large = sketch_neighborhood(make_neighborhood(1000, 500), N, def_hash_modulus);
    check(large.size() == N && !large.undersized(N), "large neighborhood has N values");
    check(std::is_sorted(large.mins().cbegin(), large.mins().cend()), "values ascending");

    // Bottom N of all hashes
    std::vector<uint64_t> all_hashes;
    for (uint64_t key = 1000; key < 1500; key++) {
        all_hashes.push_back(hash_kmer(key, def_hash_modulus));
    }
    std::sort(all_hashes.begin(), all_hashes.end());
    check(std::equal(large.mins().cbegin(), large.mins().cend(), all_hashes.cbegin()),
          "sketch keeps the smallest hashes");
    for (auto hash_it = large.mins().cbegin(); hash_it != large.mins().cend(); ++hash_it) {
        check(*hash_it < def_hash_modulus, "hash reduced by modulus");
    }

    // Order of k-mers does not matter
    Neighborhood shuffled = make_neighborhood(1000, 500);
    std::reverse(shuffled.kmers.begin(), shuffled.kmers.end());
    check(sketch_neighborhood(shuffled, N, def_hash_modulus).mins() == large.mins(),
          "identical sets, identical sketches");

    // Duplicated k-mers counted once
    Neighborhood repeated = make_neighborhood(0, 5);
    repeated.kmers.push_back(3);
    check(sketch_neighborhood(repeated, N, def_hash_modulus).mins() == small.mins(),
          "repeats ignored");

    bool thrown = false;
    try {
        sketch_neighborhood(make_neighborhood(0, 5), 0, def_hash_modulus);
    } catch (const std::invalid_argument& e) {
        thrown = true;
    }
    check(thrown, "sketch size 0 rejected");
    std::cout << "Sketch construction OK" << std::endl;

    // Jaccard
    JaccardEstimate self = jaccard(large, large, N);
    check(self.jaccard == 1.0 && self.shared == N && !self.undersized, "self similarity");
    NbhdSketch other = sketch_neighborhood(make_neighborhood(100000, 500), N, def_hash_modulus);
    check(jaccard(large, other, N).jaccard == 0.0, "disjoint sets share no values");

    NbhdSketch half_a = sketch_neighborhood(make_neighborhood(0, 4), N, def_hash_modulus);
    NbhdSketch half_b = sketch_neighborhood(make_neighborhood(2, 4), N, def_hash_modulus);
    JaccardEstimate exact = jaccard(half_a, half_b, N);
    check(exact.undersized && exact.shared == 2 && exact.union_size == 6,
          "exact Jaccard for undersized sketches");
    check(exact.jaccard > 0.33 && exact.jaccard < 0.34, "2 shared of 6");

    NbhdSketch empty;
    check(jaccard(empty, empty, N).jaccard == 0.0, "empty sketches");
    std::cout << "Jaccard OK" << std::endl;

    // Parallel sketching keeps neighborhood order
    std::vector<Neighborhood> nbhds;
    for (uint64_t i = 0; i < 50; i++) {
        nbhds.push_back(make_neighborhood(i * 1000, 10 + i * 7));
    }
    std::vector<NbhdSketch> serial = sketch_neighborhoods(nbhds, N, def_hash_modulus, 1);
    std::vector<NbhdSketch> threaded = sketch_neighborhoods(nbhds, N, def_hash_modulus, 4);
    check(serial == threaded, "same sketches with 1 and 4 threads");
    check(serial[7].tag() == 7000, "order kept");
    std::cout << "Parallel sketching OK" << std::endl;

    return 0;
}

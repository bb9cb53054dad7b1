#include <iostream>
#include <vector>

#include "graph/kmer.hpp"
#include "test_utils.hpp"

int main (int argc, char* argv[])
{
    // Canonical keys are strand independent
    for (size_t k = 1; k <= max_dna_k; k++) {
        KmerCodec codec(k, Alphabet::DNA);
        for (uint64_t seed = 0; seed < 50; seed++) {
            std::string kmer = random_sequence(k, seed * 100 + k);
            uint64_t key = codec.encode(kmer);
            check(key == codec.encode(reverse_complement(kmer)),
                  "encode(x) == encode(rc(x)) for " + kmer);
            std::string decoded = codec.decode(key);
            check(decoded == kmer || decoded == reverse_complement(kmer),
                  "decode gives one strand of " + kmer);
            check(decoded <= reverse_complement(decoded),
                  "canonical form is the lexicographically smaller strand");
        }
    }
    std::cout << "DNA canonicalisation OK" << std::endl;

    KmerCodec dna(4, Alphabet::DNA);
    check(dna.encode("AAAA") == 0, "AAAA is key 0");
    check(dna.encode("TTTT") == 0, "TTTT is the reverse complement of AAAA");
    check(dna.encode("acgt") == dna.encode("ACGT"), "lower case folded");
    check(dna.encode("ACGU") == dna.encode("ACGT"), "U read as T");
    check(dna.reverse_complement(dna.encode("AACG")) == dna.encode("CGTT"),
          "2-bit reverse complement");

    bool thrown = false;
    try {
        dna.encode("ACNT");
    } catch (const InvalidSymbolError& e) {
        thrown = true;
        check(e.symbol() == 'N' && e.position() == 2, "error locates symbol");
    }
    check(thrown, "N is not a DNA symbol");

    thrown = false;
    try {
        dna.encode("ACG");
    } catch (const std::invalid_argument& e) {
        thrown = true;
    }
    check(thrown, "window must be k long");

    thrown = false;
    try {
        KmerCodec too_long(33, Alphabet::DNA);
    } catch (const std::invalid_argument& e) {
        thrown = true;
    }
    check(thrown, "k > 32 rejected for DNA");

    // Protein keys are not reverse complemented
    KmerCodec prot(5, Alphabet::Protein);
    check(prot.encode("MKVLA") != prot.encode("AVLKM"), "protein strands distinct");
    check(prot.decode(prot.encode("MKVLA")) == "MKVLA", "protein decode");
    check(prot.decode(prot.encode("wyacd")) == "WYACD", "protein lower case");
    thrown = false;
    try {
        prot.encode("MKXLA");
    } catch (const InvalidSymbolError& e) {
        thrown = true;
    }
    check(thrown, "X is not one of the 20 amino acids");
    thrown = false;
    try {
        KmerCodec too_long(max_protein_k + 1, Alphabet::Protein);
    } catch (const std::invalid_argument& e) {
        thrown = true;
    }
    check(thrown, "protein k limited by key width");
    std::cout << "Encoding errors OK" << std::endl;

    // Windows containing an invalid symbol are skipped, not fatal
    KmerCodec codec3(3, Alphabet::DNA);
    std::string seq = "ACGTNACGTA";
    KmerIterator kmer_it(codec3, seq);
    std::vector<size_t> positions;
    while (kmer_it.next()) {
        positions.push_back(kmer_it.position());
        check(kmer_it.key() == codec3.encode(seq.substr(kmer_it.position(), 3)),
              "rolling key matches direct encoding");
    }
    check(positions == std::vector<size_t>({0, 1, 5, 6, 7}),
          "windows overlapping N skipped");
    check(kmer_it.invalid_symbols() == 1, "one invalid symbol counted");
    std::cout << "Rolling encoder OK" << std::endl;

    // One-symbol extensions both ways
    std::vector<uint64_t> ext;
    KmerCodec codec5(5, Alphabet::DNA);
    uint64_t key = codec5.encode("ACGGA");
    codec5.extensions(key, ext);
    check(ext.size() == 8, "2 x 4 DNA extensions");
    std::vector<std::string> expected = {"CGGAA", "CGGAC", "CGGAG", "CGGAT",
                                         "AACGG", "CACGG", "GACGG", "TACGG"};
    for (const auto& kmer : expected) {
        bool found = false;
        for (auto ext_key : ext) {
            found |= ext_key == codec5.encode(kmer);
        }
        check(found, kmer + " is adjacent to ACGGA");
    }
    prot.extensions(prot.encode("MKVLA"), ext);
    check(ext.size() == 40, "2 x 20 protein extensions");
    std::cout << "Extensions OK" << std::endl;

    return 0;
}

#pragma once

#include <boost/algorithm/string.hpp>
#include <charconv>
#include <compare>
#include <cstdint>
#include <istream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

namespace biodispatch {

/**
 * @ingroup file_io
 * @brief Indel call reported on a `*` line of `pileup -c`.
 */
struct IndelCall {
  /**
   * First allele, "*" for the reference, e.g. "+A" or "-TT".
   */
  std::string first_allele;

  /**
   * Second allele.
   */
  std::string second_allele;

  std::uint32_t first_count{};
  std::uint32_t second_count{};

  /**
   * Reads supporting any other indel.
   */
  std::uint32_t other_count{};
};

/**
 * @ingroup file_io
 * @brief One line of `samtools pileup` output.
 *
 * Three layouts are understood:
 * - plain (6 columns): chrom, pos, ref_base, coverage, read_bases,
 *   base_qualities.
 * - consensus, `pileup -c` (10 columns): chrom, pos, ref_base, consensus,
 *   consensus_quality, snp_quality, rms_mapping_quality, coverage,
 *   read_bases, base_qualities.
 * - `-s` adds mapping_qualities after base_qualities to both of the above
 *   (7 and 11 columns).
 * - indel, `pileup -c` with ref_base `*` (13 columns or more): chrom, pos,
 *   `*`, genotype, consensus_quality, snp_quality, rms_mapping_quality,
 *   coverage, then the IndelCall fields.
 */
struct PileupRecord {
  /**
   * Reference sequence name.
   */
  std::string chrom;

  /**
   * One-based position on the reference.
   */
  std::uint32_t pos{};

  /**
   * Reference base, or '*' on indel lines.
   */
  char ref_base{};

  /**
   * Consensus base (IUPAC code) or, on indel lines, the genotype of the two
   * alleles. Empty without `-c`.
   */
  std::string consensus;

  /**
   * Phred-scaled qualities of the consensus call.
   * - Zero without `-c`.
   */
  int consensus_quality = 0;
  int snp_quality = 0;
  int rms_mapping_quality = 0;

  /**
   * Number of reads covering the position.
   */
  std::uint32_t coverage{};

  /**
   * Read bases and their qualities. Empty on indel lines.
   */
  std::string read_bases;
  std::string base_qualities;

  /**
   * Mapping quality of each read, one character per read. Only with `-s`.
   */
  std::string mapping_qualities;

  /**
   * Set on indel lines only.
   */
  std::optional<IndelCall> indel;

  auto
  has_consensus() const noexcept {
    return !consensus.empty();
  }

  auto
  is_indel() const noexcept {
    return indel.has_value();
  }

  /**
   * Three-way comparation (spaceship operator): strong ordering
   * - compare two PileupRecord order with chrom->pos
   */
  auto
  operator<=>(const PileupRecord& other) const noexcept {
    return std::tie(chrom, pos) <=> std::tie(other.chrom, other.pos);
  }
};

namespace detail {

template<typename T>
auto
to_number(std::string_view field) {
  auto value = T{};
  const auto [ptr, ec]
    = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec != std::errc{} || ptr != field.data() + field.size())
    throw std::invalid_argument("Invalid pileup field: "
                                + std::string{field});
  return value;
}

}  // namespace detail

/**
 * Parse one pileup line.
 *
 * @throw std::invalid_argument if the line matches none of the layouts.
 */
inline auto
parse_pileup_line(std::string_view line) {
  using detail::to_number;

  auto fields = std::vector<std::string>{};
  const auto buffer = std::string{line};
  boost::split(fields, buffer, boost::is_any_of("\t"));

  auto r = PileupRecord{};
  if (fields.size() < 6 || fields[2].size() != 1)
    throw std::invalid_argument("Invalid pileup line: " + buffer);
  r.chrom = fields[0];
  r.pos = to_number<std::uint32_t>(fields[1]);
  r.ref_base = fields[2].front();

  if (r.ref_base == '*') {
    if (fields.size() < 13)
      throw std::invalid_argument("Invalid pileup indel line: " + buffer);
    r.consensus = fields[3];
    r.consensus_quality = to_number<int>(fields[4]);
    r.snp_quality = to_number<int>(fields[5]);
    r.rms_mapping_quality = to_number<int>(fields[6]);
    r.coverage = to_number<std::uint32_t>(fields[7]);
    r.indel = IndelCall{fields[8], fields[9],
                        to_number<std::uint32_t>(fields[10]),
                        to_number<std::uint32_t>(fields[11]),
                        to_number<std::uint32_t>(fields[12])};
  } else if (fields.size() == 6 || fields.size() == 7) {
    r.coverage = to_number<std::uint32_t>(fields[3]);
    r.read_bases = fields[4];
    r.base_qualities = fields[5];
    if (fields.size() == 7)
      r.mapping_qualities = fields[6];
  } else if (fields.size() == 10 || fields.size() == 11) {
    r.consensus = fields[3];
    r.consensus_quality = to_number<int>(fields[4]);
    r.snp_quality = to_number<int>(fields[5]);
    r.rms_mapping_quality = to_number<int>(fields[6]);
    r.coverage = to_number<std::uint32_t>(fields[7]);
    r.read_bases = fields[8];
    r.base_qualities = fields[9];
    if (fields.size() == 11)
      r.mapping_qualities = fields[10];
  } else
    throw std::invalid_argument("Invalid pileup line: " + buffer);
  return r;
}

/**
 * Read one record per line; sets failbit at end of input.
 */
inline auto&
operator>>(std::istream& is, PileupRecord& r) {
  auto line = std::string{};
  while (std::getline(is, line) && line.empty()) {}
  if (is)
    r = parse_pileup_line(line);
  return is;
}

/**
 * Parse the whole output of a pileup run. Blank lines are skipped.
 */
inline auto
parse_pileup(const std::string& output) {
  auto records = std::vector<PileupRecord>{};
  auto iss = std::istringstream{output};
  for (auto r = PileupRecord{}; iss >> r;)
    records.push_back(std::move(r));
  return records;
}

}  // namespace biodispatch

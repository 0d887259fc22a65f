#include "jpeg_internal.hpp"

#include <vexel/log.hpp>

#include <algorithm>
#include <optional>
#include <string>

namespace vexel::jpeg_detail {

// ============================================================================
// Table construction
// ============================================================================

status assign_canonical_codes(jpeg_huffman_table& table) {
    std::size_t total = 0;
    for (auto count : table.counts) {
        total += count;
    }
    if (total != table.symbols.size()) {
        return failure(decode_error::invalid_data,
            "Huffman table declares " + std::to_string(total) + " symbols but holds " +
            std::to_string(table.symbols.size()));
    }

    table.codes.assign(total, 0);
    std::uint32_t code = 0;
    std::size_t k = 0;
    for (unsigned len = 1; len <= 16; ++len) {
        for (unsigned i = 0; i < table.counts[len - 1]; ++i) {
            table.codes[k++] = static_cast<std::uint16_t>(code++);
        }
        if (code > (1u << len)) {
            return failure(decode_error::invalid_data,
                "over-subscribed Huffman code lengths in table " + std::to_string(table.id));
        }
        code <<= 1;
    }
    return {};
}

huffman_lookup build_lookup(const jpeg_huffman_table& table) {
    huffman_lookup lookup;
    lookup.symbols = table.symbols;

    std::int32_t p = 0;
    for (unsigned len = 1; len <= 16; ++len) {
        const std::int32_t count = table.counts[len - 1];
        if (count == 0) {
            lookup.maxcode[len] = -1;
            continue;
        }
        lookup.valptr[len] = p;
        lookup.mincode[len] = table.codes[static_cast<std::size_t>(p)];
        p += count;
        lookup.maxcode[len] = table.codes[static_cast<std::size_t>(p - 1)];
    }
    lookup.maxcode[17] = 0x7FFFFFFF;
    return lookup;
}

result<std::uint8_t> decode_symbol(bit_reader& reader, const huffman_lookup& lookup) {
    std::int32_t code = 0;
    for (unsigned len = 1; len <= 16; ++len) {
        auto bit = reader.read_bit();
        if (!bit) {
            return bit.error_info();
        }
        code = (code << 1) | (bit.value() ? 1 : 0);
        if (code <= lookup.maxcode[len]) {
            const auto index = static_cast<std::size_t>(lookup.valptr[len] + code - lookup.mincode[len]);
            if (index >= lookup.symbols.size()) {
                break;
            }
            return lookup.symbols[index];
        }
    }
    return failure(decode_error::invalid_data, "invalid Huffman code in entropy-coded data");
}

// ============================================================================
// Huffman entropy decoder
// ============================================================================

namespace {

class huffman_entropy_decoder final : public entropy_decoder {
public:
    huffman_entropy_decoder(const jpeg_scan_info& scan, bool progressive, scan_tables tables)
        : ss_(scan.spectral_start),
          se_(scan.spectral_end),
          ah_(scan.approx_high),
          al_(scan.approx_low),
          progressive_(progressive),
          tables_(std::move(tables)),
          dc_pred_(scan.components.size(), 0) {}

    void start_segment(std::span<const std::uint8_t> data) override {
        reader_.emplace(data);
        std::fill(dc_pred_.begin(), dc_pred_.end(), 0);
        eobrun_ = 0;
    }

    status decode_mcu(std::span<const mcu_block> blocks) override {
        for (const auto& blk : blocks) {
            status st;
            if (!progressive_) {
                st = decode_sequential(blk);
            } else if (ss_ == 0) {
                st = ah_ == 0 ? decode_dc_first(blk) : decode_dc_refine(blk);
            } else {
                st = ah_ == 0 ? decode_ac_first(blk) : decode_ac_refine(blk);
            }
            if (!st) {
                return st;
            }
        }
        return {};
    }

private:
    result<std::uint8_t> symbol(const huffman_lookup* table) {
        if (table == nullptr) {
            return failure(decode_error::invalid_data, "scan references an undefined Huffman table");
        }
        return decode_symbol(*reader_, *table);
    }

    result<std::int32_t> receive_extend(unsigned s) {
        if (s == 0) {
            return 0;
        }
        if (s > 16) {
            return failure(decode_error::invalid_data, "coefficient magnitude category " +
                std::to_string(s) + " exceeds 16");
        }
        auto bits = reader_->read_bits(s);
        if (!bits) {
            return bits.error_info();
        }
        return extend(bits.value(), s);
    }

    status decode_dc_diff(const mcu_block& blk, std::int32_t& out) {
        auto s = symbol(tables_.dc[blk.scan_component]);
        if (!s) {
            return s.error_info();
        }
        auto diff = receive_extend(s.value());
        if (!diff) {
            return diff.error_info();
        }
        dc_pred_[blk.scan_component] += diff.value();
        out = dc_pred_[blk.scan_component];
        return {};
    }

    status decode_sequential(const mcu_block& blk) {
        std::int32_t* coef = blk.coef;
        std::int32_t dc = 0;
        auto st = decode_dc_diff(blk, dc);
        if (!st) {
            return st;
        }
        coef[0] = dc;

        const huffman_lookup* ac = tables_.ac[blk.scan_component];
        for (unsigned k = 1; k < 64; ++k) {
            auto rs = symbol(ac);
            if (!rs) {
                return rs.error_info();
            }
            const unsigned r = rs.value() >> 4;
            const unsigned s = rs.value() & 0x0F;
            if (s == 0) {
                if (r != 15) {
                    break;  // EOB
                }
                k += 15;    // ZRL
                continue;
            }
            k += r;
            if (k > 63) {
                return failure(decode_error::invalid_data, "AC coefficient run past end of block");
            }
            auto v = receive_extend(s);
            if (!v) {
                return v.error_info();
            }
            coef[jpeg_zigzag[k]] = v.value();
        }
        return {};
    }

    status decode_dc_first(const mcu_block& blk) {
        std::int32_t dc = 0;
        auto st = decode_dc_diff(blk, dc);
        if (!st) {
            return st;
        }
        blk.coef[0] = static_cast<std::int32_t>(static_cast<std::uint32_t>(dc) << al_);
        return {};
    }

    status decode_dc_refine(const mcu_block& blk) {
        auto bit = reader_->read_bit();
        if (!bit) {
            return bit.error_info();
        }
        if (bit.value()) {
            blk.coef[0] |= (1 << al_);
        }
        return {};
    }

    status decode_ac_first(const mcu_block& blk) {
        if (eobrun_ > 0) {
            --eobrun_;
            return {};
        }

        const huffman_lookup* ac = tables_.ac[blk.scan_component];
        for (unsigned k = ss_; k <= se_; ++k) {
            auto rs = symbol(ac);
            if (!rs) {
                return rs.error_info();
            }
            unsigned r = rs.value() >> 4;
            const unsigned s = rs.value() & 0x0F;
            if (s != 0) {
                k += r;
                if (k > se_) {
                    return failure(decode_error::invalid_data, "AC coefficient run past end of band");
                }
                auto v = receive_extend(s);
                if (!v) {
                    return v.error_info();
                }
                blk.coef[jpeg_zigzag[k]] = static_cast<std::int32_t>(static_cast<std::uint32_t>(v.value()) << al_);
            } else if (r == 15) {
                k += 15;
            } else {
                eobrun_ = 1u << r;
                if (r != 0) {
                    auto extra = reader_->read_bits(r);
                    if (!extra) {
                        return extra.error_info();
                    }
                    eobrun_ += extra.value();
                }
                --eobrun_;  // this block ends the band now
                break;
            }
        }
        return {};
    }

    // Correction bit for a coefficient that was already nonzero.
    status refine_nonzero(std::int32_t& coef, std::int32_t p1, std::int32_t m1) {
        auto bit = reader_->read_bit();
        if (!bit) {
            return bit.error_info();
        }
        if (bit.value() && (coef & p1) == 0) {
            coef += coef >= 0 ? p1 : m1;
        }
        return {};
    }

    status decode_ac_refine(const mcu_block& blk) {
        const std::int32_t p1 = 1 << al_;
        const std::int32_t m1 = -(1 << al_);
        std::int32_t* coef = blk.coef;
        unsigned k = ss_;

        if (eobrun_ == 0) {
            const huffman_lookup* ac = tables_.ac[blk.scan_component];
            for (; k <= se_; ++k) {
                auto rs = symbol(ac);
                if (!rs) {
                    return rs.error_info();
                }
                int r = rs.value() >> 4;
                const unsigned s = rs.value() & 0x0F;
                std::int32_t value = 0;

                if (s != 0) {
                    if (s != 1) {
                        log_warn("JPEG: invalid magnitude in AC refinement scan");
                    }
                    auto sign = reader_->read_bit();
                    if (!sign) {
                        return sign.error_info();
                    }
                    value = sign.value() ? p1 : m1;
                } else if (r != 15) {
                    eobrun_ = 1u << r;
                    if (r != 0) {
                        auto extra = reader_->read_bits(static_cast<unsigned>(r));
                        if (!extra) {
                            return extra.error_info();
                        }
                        eobrun_ += extra.value();
                    }
                    break;  // rest of the band is handled by the EOB run below
                }

                // Skip r zero-history coefficients, refining nonzero ones on the way
                do {
                    std::int32_t& c = coef[jpeg_zigzag[k]];
                    if (c != 0) {
                        auto st = refine_nonzero(c, p1, m1);
                        if (!st) {
                            return st;
                        }
                    } else {
                        if (--r < 0) {
                            break;
                        }
                    }
                    ++k;
                } while (k <= se_);

                if (value != 0 && k <= se_) {
                    coef[jpeg_zigzag[k]] = value;
                }
            }
        }

        if (eobrun_ > 0) {
            for (; k <= se_; ++k) {
                std::int32_t& c = coef[jpeg_zigzag[k]];
                if (c != 0) {
                    auto st = refine_nonzero(c, p1, m1);
                    if (!st) {
                        return st;
                    }
                }
            }
            --eobrun_;
        }
        return {};
    }

    unsigned ss_;
    unsigned se_;
    unsigned ah_;
    unsigned al_;
    bool progressive_;
    scan_tables tables_;
    std::optional<bit_reader> reader_;
    std::vector<std::int32_t> dc_pred_;
    std::uint32_t eobrun_ = 0;
};

} // namespace

std::unique_ptr<entropy_decoder> make_huffman_decoder(const jpeg_scan_info& scan,
                                                      bool progressive,
                                                      scan_tables tables) {
    return std::make_unique<huffman_entropy_decoder>(scan, progressive, std::move(tables));
}

} // namespace vexel::jpeg_detail

#include "expect_error.hpp"
#include "general/hex.hpp"
#include "general/reader.hpp"
#include "general/writer.hpp"
#include "pool/market_layout.hpp"
#include "pool/record.hpp"
#include <vector>
using namespace std;
using namespace pool;

PoolHeader sample_header(PoolStatus status)
{
    return {
        .marketProgramId = tagged(0x01),
        .seed = PoolSeed { tagged_bytes(0x02, 0) },
        .signalProvider = tagged(0x03),
        .status = status,
        .numberOfMarkets = 2,
        .feeRatio = 0x1234,
        .lastFeeCollectionTimestamp = 0x0102030405060708,
        .feeCollectionPeriod = 604800
    };
}

void test_header_roundtrip()
{
    vector<PoolStatus> statuses {
        status::Uninitialized {}, status::Unlocked {}, status::Locked {}
    };
    for (uint8_t n = 1; n <= 64; ++n) {
        statuses.push_back(status::PendingOrder { PendingCount::from_number_throw(n) });
        statuses.push_back(status::LockedPendingOrder { PendingCount::from_number_throw(n) });
    }
    for (auto& s : statuses) {
        auto h { sample_header(s) };
        array<uint8_t, PoolHeader::LEN> buf {};
        h.pack(buf);
        auto decoded { PoolHeader::unpack_unchecked(buf) };
        assert(decoded == h);
        assert(decoded.status.to_byte() == s.to_byte());
    }
}

void test_header_layout()
{
    auto h { sample_header(status::Unlocked {}) };
    array<uint8_t, PoolHeader::LEN> buf {};
    h.pack(buf);
    assert(buf[0] == 0x01);
    assert(buf[32] == 0x02);
    assert(buf[64] == 0x03);
    assert(buf[96] == 0x3f);
    assert(buf[97] == 2 && buf[98] == 0);
    assert(buf[99] == 0x34 && buf[100] == 0x12);
    assert(buf[101] == 0x08 && buf[108] == 0x01);
    assert(readuint64(buf.data() + 109) == 604800);
}

void test_header_errors()
{
    vector<uint8_t> small(PoolHeader::LEN - 1, 0);
    expect_error(EINV_ACCDATA, [&] { PoolHeader::unpack_unchecked(small); });
    vector<uint8_t> large(PoolHeader::LEN + 1, 0);
    expect_error(EINV_ACCDATA, [&] { PoolHeader::unpack_unchecked(large); });

    // the unchecked decoders accept the zeroed header of a fresh record
    vector<uint8_t> zeroed(PoolHeader::LEN, 0);
    assert(!PoolHeader::unpack_unchecked(zeroed).is_initialized());
    expect_error(EUNINITACC, [&] { PoolHeader::unpack(zeroed); });

    // a longer buffer is fine when decoding from a slice
    assert(!PoolHeader::unpack_from_slice(large).is_initialized());
    expect_error(EINV_ACCDATA, [&] { sample_header(status::Locked {}).pack(large); });
}

void test_status_bytes()
{
    assert(PoolStatus::from_byte(0x00) == status::Uninitialized {});
    assert(PoolStatus::from_byte(0x3f) == status::Unlocked {});
    // any nonzero byte in mode 0 decodes as unlocked
    assert(PoolStatus::from_byte(0x01) == status::Unlocked {});
    assert(PoolStatus::from_byte(0x80) == status::Locked {});
    assert(PoolStatus::from_byte(0x85) == status::Locked {});
    assert(PoolStatus::from_byte(0x40).pending_orders() == 1);
    assert(PoolStatus::from_byte(0x7f).pending_orders() == 64);
    auto lp { PoolStatus::from_byte(0xc2) };
    assert(lp.is_locked() && lp.has_pending_orders() && lp.pending_orders() == 3);

    PoolStatus locked { status::Locked {} };
    assert(locked.to_byte() == 0x80);
    assert(lp.to_string() == "LockedPendingOrder(3)");
}

void test_record_tables()
{
    vector<uint8_t> storage(required_size(2, 3), 0);
    assert(storage.size() == 117 + 2 * 32 + 3 * 32);
    PoolRecord r(storage);
    auto h { sample_header(status::Unlocked {}) };
    r.write_header(h);
    r.write_markets({ tagged(0x50), tagged(0x51) });
    assert(r.market(1) == tagged(0x51));
    expect_error(EINV_ARGUMENT, [&] { r.market(2); });
    expect_error(EINV_ARGUMENT, [&] { r.write_markets({ tagged(0x50) }); });

    assert(r.asset_capacity() == 3);
    assert(r.assets().empty());
    assert(!r.asset(0).is_initialized());
    r.write_asset(2, { tagged(0x60) });
    r.write_asset(0, { tagged(0x61) });
    auto assets { r.assets() };
    assert(assets.size() == 2);
    assert(assets[0].mint == tagged(0x61));
    assert(assets[1].mint == tagged(0x60));
    assert(storage[117 + 64 + 64] == 0x60);
    expect_error(EINV_ARGUMENT, [&] { r.asset(3); });

    r.release_asset(0);
    assert(!r.asset(0).is_initialized());
    assert(r.assets().size() == 1);

    r.reset();
    assert(!r.header_unchecked().is_initialized());
    assert(r.header_unchecked().seed == h.seed);
    for (size_t i = PoolHeader::LEN; i < storage.size(); ++i)
        assert(storage[i] == 0);
    expect_error(EUNINITACC, [&] { r.header(); });

    vector<uint8_t> tooSmall(100, 0);
    expect_error(EINV_ACCDATA, [&] { PoolRecord { tooSmall }; });
}

void test_asset_slot()
{
    array<uint8_t, 32> zero {};
    assert(PoolAsset::unpack_unchecked(zero) == PoolAsset::uninitialized());
    array<uint8_t, 31> shortSlot {};
    expect_error(EINV_ACCDATA, [&] { PoolAsset::unpack_unchecked(shortSlot); });
}

void test_foreign_layouts()
{
    vector<uint8_t> oo(200, 0);
    Writer w(span<uint8_t>(oo).subspan(77, 32));
    w << uint64_t(5) << uint64_t(7) << uint64_t(11) << uint64_t(13);
    OpenOrdersView v(oo);
    assert(v.free_base() == 5);
    assert(v.total_base() == 7);
    assert(v.free_quote() == 11);
    assert(v.total_quote() == 13);
    assert(!v.is_unused() && !v.is_fully_free() && !v.nothing_free());

    vector<uint8_t> truncated(100, 0);
    expect_error(EINV_ACCDATA, [&] { OpenOrdersView(truncated).total_quote(); });

    vector<uint8_t> market(117, 0);
    market[53] = 0xab;
    market[85] = 0xcd;
    MarketStateView m(market);
    assert(m.coin_mint()[0] == 0xab);
    assert(m.pc_mint()[0] == 0xcd);
    market.resize(116);
    expect_error(EINV_ACCDATA, [&] { MarketStateView(market).pc_mint(); });
}

void test_reader_writer()
{
    array<uint8_t, 11> buf {};
    Writer w(buf);
    w << uint16_t(0xbeef) << uint64_t(1) << uint8_t(9);
    expect_error(EINV_ACCDATA, [&] { w << uint8_t(1); });
    Reader r(buf);
    assert(r.uint16() == 0xbeef);
    assert(buf[0] == 0xef);
    assert(r.uint64() == 1);
    assert(r.uint8() == 9);
    assert(r.eof());
    expect_error(EINV_ACCDATA, [&] { r.uint8(); });
}

void test_hex()
{
    auto i { tagged(0x7e, 0x01) };
    auto s { i.hex_string() };
    assert(s.size() == 64);
    assert(s.substr(0, 4) == "7e01");
    assert(Identity::from_hex_throw(s) == i);
    assert(!Identity::parse_string(s.substr(1)));
    expect_error(EINV_HEX, [&] { Identity::from_hex_throw(string(64, 'g')); });
    assert(hex_to_vec(" 0a0B\n ff ") == (vector<uint8_t> { 0x0a, 0x0b, 0xff }));
    expect_error(EINV_HEX, [&] { hex_to_vec("abc"); });
}

int main()
{
    test_header_roundtrip();
    test_header_layout();
    test_header_errors();
    test_status_bytes();
    test_record_tables();
    test_asset_slot();
    test_foreign_layouts();
    test_reader_writer();
    test_hex();
    cout << "codec tests passed" << endl;
}

#include "fake_host.hpp"
#include "pool_json.hpp"
using namespace std;

void test_pool_json()
{
    PoolFixture f;
    f.create_pool();
    f.processor.create_order(f.order_op(32768));

    auto j { jsonmsg::pool_storage_json(f.host.bytes(f.pool)) };
    assert(j["size"] == pool::required_size(1, 4));
    auto& h { j["header"] };
    assert(h["status"] == "PendingOrder(1)");
    assert(h["statusByte"] == 0x40);
    assert(h["pendingOrders"] == 1);
    assert(h["locked"] == false);
    assert(h["seed"] == f.seed.hex_string());
    assert(h["signalProvider"] == f.signalProvider.hex_string());
    assert(h["feeRatio"] == f.feeRatio);
    assert(h["feeCollectionPeriod"] == f.feePeriod);
    assert(h["lastFeeCollectionTimestamp"] == f.host.now);

    assert(j["markets"].size() == 1);
    assert(j["markets"][0] == f.marketKey.hex_string());
    assert(j["assetCapacity"] == 4);
    auto& assets { j["assets"] };
    assert(assets.size() == 3);
    assert(assets[0]["mint"] == f.mintA.hex_string());
    assert(assets[2]["index"] == 2);
    assert(assets[2]["mint"] == f.mintC.hex_string());
}

void test_uninitialized()
{
    vector<uint8_t> storage(pool::required_size(1, 4), 0);
    auto j { jsonmsg::pool_storage_json(storage) };
    assert(j["header"]["status"] == "Uninitialized");
    assert(!j.contains("markets"));
    assert(!j.contains("assets"));
}

void test_malformed_storage()
{
    PoolFixture f;
    f.create_pool();
    const auto full { f.host.bytes(f.pool) };

    vector<uint8_t> shortHeader(full.begin(), full.begin() + 100);
    expect_error(EINV_ACCDATA, [&] { jsonmsg::pool_storage_json(shortHeader); });

    // the header announces more markets than the storage holds
    auto oversized { full };
    oversized[97] = 0xff;
    oversized[98] = 0xff;
    expect_error(EINV_ACCDATA, [&] { jsonmsg::pool_storage_json(oversized); });

    // cut inside the market table
    vector<uint8_t> truncated(full.begin(), full.begin() + 117 + 16);
    expect_error(EINV_ACCDATA, [&] { jsonmsg::pool_storage_json(truncated); });

    // cut inside the asset table, the partial slot is not listed
    vector<uint8_t> partial(full.begin(), full.begin() + 117 + 32 + 32 + 10);
    auto j { jsonmsg::pool_storage_json(partial) };
    assert(j["assetCapacity"] == 1);
    assert(j["assets"].size() == 1);
    assert(j["assets"][0]["mint"] == f.mintA.hex_string());
}

int main()
{
    test_pool_json();
    test_uninitialized();
    test_malformed_storage();
    cout << "inspect tests passed" << endl;
}

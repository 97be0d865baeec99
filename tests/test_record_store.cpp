// tests/test_record_store.cpp
#include "tests.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "recall/store/record_store.hpp"
#include "recall/buffer/heap_buffer.hpp"
#include "recall/buffer/unchecked_buffer.hpp"
#include "order.hpp"

namespace {

	using recall::tests::order;
	using recall::tests::order_transcoder;
	using recall::store::slot_state;

	constexpr static std::int64_t ID = 17;
	constexpr static std::size_t MAX_RECORDS = 16;
	constexpr static std::size_t RECORD_LENGTH = 64;

	template <typename BufferT>
	using store_type = recall::store::record_store<BufferT>;

	template <typename StoreT>
	void fill(StoreT& store, order_transcoder& transcoder, std::int64_t from, std::int64_t to) {
		for (auto i = from; i < to; ++i) {
			const auto value = order::of(i);
			store.store(transcoder, value, value);
		}
	}

	template <typename StoreT>
	std::vector<std::int64_t> live_keys(const StoreT& store) {
		std::vector<std::int64_t> keys;
		store.for_each([&keys](std::int64_t key, std::size_t) { keys.push_back(key); });
		return keys;
	}
}

TEST_SUITE("record store") {

	TEST_CASE_TEMPLATE("store and load", BufferT, recall::buffer::heap_buffer, recall::buffer::unchecked_buffer) {
		store_type<BufferT> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		CHECK(store.payload_size() >= order_transcoder::encoded_size);

		const auto value = order::of(ID);
		store.store(transcoder, value, value);
		CHECK(store.size() == 1);
		CHECK(store.contains(ID));

		auto container = order::of(-1);
		REQUIRE(store.load(ID, transcoder, container));
		CHECK(container == value);
	}

	TEST_CASE_TEMPLATE("missing key leaves container untouched", BufferT, recall::buffer::heap_buffer, recall::buffer::unchecked_buffer) {
		store_type<BufferT> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		auto container = order::of(-1);
		CHECK_FALSE(store.load(ID, transcoder, container));
		CHECK(container == order::of(-1));
		CHECK(transcoder.decoded == 0);
	}

	TEST_CASE("remove") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		SUBCASE("existing key") {
			const auto value = order::of(ID);
			store.store(transcoder, value, value);
			CHECK(store.remove(ID));
			CHECK(store.size() == 0);
			CHECK(store.state_at(0) == slot_state::tombstone);

			auto container = order::of(-1);
			CHECK_FALSE(store.load(ID, transcoder, container));
			CHECK_FALSE(store.remove(ID));
		}
		SUBCASE("unknown key") {
			CHECK_FALSE(store.remove(ID));
			CHECK(store.next_write_offset() == 0);
		}
	}

	TEST_CASE("update in place keeps the write cursor") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		const auto value = order::of(ID);
		store.store(transcoder, value, value);
		const auto cursor = store.next_write_offset();
		CHECK(cursor == RECORD_LENGTH);

		const order updated{
			.id = ID,
			.instrument_id = 17,
			.quantity = 37,
			.created_epoch_seconds = 13,
			.limit_price = 17,
			.side = 35,
			.symbol = "Foo",
		};
		store.store(transcoder, updated, updated);
		CHECK(store.next_write_offset() == cursor);
		CHECK(store.size() == 1);

		auto container = order::of(-1);
		REQUIRE(store.load(ID, transcoder, container));
		CHECK(container == updated);

		const auto other = order::of(ID + 1);
		store.store(transcoder, other, other);
		CHECK(store.next_write_offset() == cursor + RECORD_LENGTH);
	}

	TEST_CASE("store after removal") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		const auto value = order::of(ID);
		store.store(transcoder, value, value);
		REQUIRE(store.remove(ID));
		store.store(transcoder, value, value);

		auto container = order::of(-1);
		REQUIRE(store.load(ID, transcoder, container));
		CHECK(container == value);
		CHECK(store.next_write_offset() == 2 * RECORD_LENGTH);
	}

	TEST_CASE_TEMPLATE("capacity boundary", BufferT, recall::buffer::heap_buffer, recall::buffer::unchecked_buffer) {
		store_type<BufferT> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		fill(store, transcoder, 0, MAX_RECORDS);
		CHECK(store.size() == MAX_RECORDS);

		const auto bytes_before = std::vector<recall::core::byte>(store.buffer().data().begin(), store.buffer().data().end());
		const auto cursor_before = store.next_write_offset();

		const auto extra = order::of(MAX_RECORDS);
		CHECK_THROWS_AS(store.store(transcoder, extra, extra), recall::core::capacity_exceeded);

		CHECK(store.size() == MAX_RECORDS);
		CHECK(store.next_write_offset() == cursor_before);
		CHECK_FALSE(store.contains(MAX_RECORDS));
		const auto bytes_after = store.buffer().data();
		CHECK(std::equal(bytes_before.begin(), bytes_before.end(), bytes_after.begin(), bytes_after.end()));

		// updates of existing keys still work at capacity
		auto updated = order::of(3);
		updated.symbol = "FULL";
		store.store(transcoder, updated, updated);
		auto container = order::of(-1);
		REQUIRE(store.load(3, transcoder, container));
		CHECK(container.symbol == "FULL");
	}

	TEST_CASE("capacity_exceeded reports the capacity") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, 2);
		order_transcoder transcoder;
		fill(store, transcoder, 0, 2);
		try {
			const auto extra = order::of(2);
			store.store(transcoder, extra, extra);
			FAIL("capacity_exceeded expected");
		}
		catch (const recall::core::capacity_exceeded& ex) {
			CHECK(ex.capacity() == 2);
		}
	}

	TEST_CASE_TEMPLATE("compact after removal", BufferT, recall::buffer::heap_buffer, recall::buffer::unchecked_buffer) {
		store_type<BufferT> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		fill(store, transcoder, 0, MAX_RECORDS);
		for (std::int64_t i = 0; i < static_cast<std::int64_t>(MAX_RECORDS); i += 2) {
			REQUIRE(store.remove(i));
		}

		store.compact();
		CHECK(store.size() == MAX_RECORDS / 2);
		CHECK(store.next_write_offset() == (MAX_RECORDS / 2) * RECORD_LENGTH);
		CHECK(live_keys(store) == std::vector<std::int64_t>{ 1, 3, 5, 7, 9, 11, 13, 15 });

		const auto first_new = static_cast<std::int64_t>(MAX_RECORDS);
		fill(store, transcoder, first_new, first_new + (MAX_RECORDS / 2) - 1);

		auto container = order::of(-1);
		for (std::int64_t i = 1; i < static_cast<std::int64_t>(MAX_RECORDS); i += 2) {
			CAPTURE(i);
			REQUIRE(store.load(i, transcoder, container));
			CHECK(container == order::of(i));
		}
		for (std::int64_t i = 0; i < static_cast<std::int64_t>(MAX_RECORDS); i += 2) {
			CHECK_FALSE(store.load(i, transcoder, container));
		}
		for (auto i = first_new; i < first_new + static_cast<std::int64_t>(MAX_RECORDS / 2) - 1; ++i) {
			REQUIRE(store.load(i, transcoder, container));
			CHECK(container == order::of(i));
		}

		const auto last = order::of(first_new + MAX_RECORDS / 2 - 1);
		store.store(transcoder, last, last);
		CHECK(store.size() == MAX_RECORDS);

		const auto overflow = order::of(first_new + MAX_RECORDS);
		CHECK_THROWS_AS(store.store(transcoder, overflow, overflow), recall::core::capacity_exceeded);
	}

	TEST_CASE("compact lays live slots out contiguously") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		fill(store, transcoder, 0, 4);
		REQUIRE(store.remove(0));
		REQUIRE(store.remove(2));
		store.compact();

		CHECK(store.next_write_offset() == 2 * RECORD_LENGTH);
		CHECK(store.state_at(0) == slot_state::live);
		CHECK(store.state_at(RECORD_LENGTH) == slot_state::live);
		CHECK(store.state_at(2 * RECORD_LENGTH) == slot_state::empty);

		std::vector<std::size_t> offsets;
		store.for_each([&offsets](std::int64_t, std::size_t offset) { offsets.push_back(offset); });
		CHECK(offsets == std::vector<std::size_t>{ 0, RECORD_LENGTH });
		CHECK(live_keys(store) == std::vector<std::int64_t>{ 1, 3 });

		// compacting an already dense store changes nothing
		store.compact();
		CHECK(store.next_write_offset() == 2 * RECORD_LENGTH);
		CHECK(live_keys(store) == std::vector<std::int64_t>{ 1, 3 });
	}

	TEST_CASE("compact on an empty store") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;
		fill(store, transcoder, 0, 3);
		for (std::int64_t i = 0; i < 3; ++i) {
			REQUIRE(store.remove(i));
		}
		store.compact();
		CHECK(store.size() == 0);
		CHECK(store.next_write_offset() == 0);
		CHECK(live_keys(store).empty());
	}

	TEST_CASE("tombstones are reclaimed once the cursor reaches the end") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;

		fill(store, transcoder, 0, MAX_RECORDS);
		REQUIRE(store.remove(4));
		REQUIRE(store.remove(9));
		CHECK(store.next_write_offset() == MAX_RECORDS * RECORD_LENGTH);

		const auto fresh = order::of(100);
		store.store(transcoder, fresh, fresh);
		CHECK(store.size() == MAX_RECORDS - 1);
		CHECK(store.next_write_offset() == (MAX_RECORDS - 1) * RECORD_LENGTH);

		auto container = order::of(-1);
		for (std::int64_t i = 0; i < static_cast<std::int64_t>(MAX_RECORDS); ++i) {
			CHECK(store.load(i, transcoder, container) == (i != 4 && i != 9));
		}
		REQUIRE(store.load(100, transcoder, container));
		CHECK(container == fresh);
	}

	TEST_CASE("constructor arguments") {
		using store_t = store_type<recall::buffer::heap_buffer>;
		CHECK_THROWS_AS(store_t(store_t::slot_header_size, 4), std::invalid_argument);
		CHECK_THROWS_AS(store_t(RECORD_LENGTH, 0), std::invalid_argument);
		store_t store(store_t::slot_header_size + 1, 4);
		CHECK(store.payload_size() == 1);
		CHECK(store.capacity() == 4);
		CHECK(store.buffer().capacity() == 4 * (store_t::slot_header_size + 1));
	}

	TEST_CASE("debug print") {
		store_type<recall::buffer::heap_buffer> store(RECORD_LENGTH, MAX_RECORDS);
		order_transcoder transcoder;
		fill(store, transcoder, 0, 2);
		REQUIRE(store.remove(0));

		std::ostringstream oss;
		store.debug_print(oss);
		const auto text = oss.str();
		CHECK(text.find("records=1/16") != std::string::npos);
		CHECK(text.find("[0] tombstone key=0") != std::string::npos);
		CHECK(text.find("[1] live key=1") != std::string::npos);
	}
}

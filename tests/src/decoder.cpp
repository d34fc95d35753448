#include "unit-tests.hpp"

#include <algorithm>
#include <cctype>
#include <variant>

using namespace lens;
using namespace lens::tests;

namespace
{
    const chain::Address FROM = makeAddress(0xaa);
    const chain::Address TO = makeAddress(0xbb);

    json makeTransferLog(std::uint64_t value)
    {
        return json{
            {"transactionHash", "0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060"},
            {"blockNumber", 100},
            {"logIndex", "0x1"},
            {"topics", json::array({TRANSFER_TOPIC, topicForAddress(FROM), topicForAddress(TO)})},
            {"data", hexPrefixed(encodeUint256Word(value))}
        };
    }

    abi::EventDefinition transferDefinition()
    {
        const auto events = abi::parseAbi(ERC20_ABI);
        EXPECT_TRUE(events.has_value());
        return events->at(1);
    }

    config::ParameterStore & configuredStore(config::ParameterStore & store, std::string abi_text)
    {
        store.set(config::Parameters{.abi = std::move(abi_text)});
        return store;
    }
}

TEST_F(UnitTest, Decoder_Matcher_FindsTransfer)
{
    const auto events = abi::parseAbi(ERC20_ABI);
    ASSERT_TRUE(events.has_value());

    const auto match = decoder::matchEvent(TRANSFER_TOPIC, *events);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->definition, &events->at(1));
    EXPECT_EQ(match->signature, "Transfer(address,address,uint256)");
}

TEST_F(UnitTest, Decoder_Matcher_RoundTripsEveryDefinition)
{
    const auto events = abi::parseAbi(R"([
        {"type": "event", "name": "A", "inputs": [{"type": "uint256"}]},
        {"type": "event", "name": "B", "inputs": [{"type": "address", "indexed": true}, {"type": "bool"}]},
        {"type": "event", "name": "C"}
    ])");
    ASSERT_TRUE(events.has_value());

    for(const abi::EventDefinition & event : *events)
    {
        const auto topic = crypto::constructEventTopicHex(abi::constructSignature(event));
        const auto match = decoder::matchEvent(topic, *events);
        ASSERT_TRUE(match.has_value());
        EXPECT_EQ(match->definition, &event);
    }
}

TEST_F(UnitTest, Decoder_Matcher_FirstDeclarationWins)
{
    const auto events = abi::parseAbi(R"([
        {"type": "event", "name": "Transfer", "inputs": [{"name": "a", "type": "address"}, {"name": "b", "type": "address"}, {"name": "c", "type": "uint256"}]},
        {"type": "event", "name": "Transfer", "inputs": [{"name": "x", "type": "address"}, {"name": "y", "type": "address"}, {"name": "z", "type": "uint256"}]}
    ])");
    ASSERT_TRUE(events.has_value());

    const auto match = decoder::matchEvent(TRANSFER_TOPIC, *events);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->definition, &events->at(0));
}

TEST_F(UnitTest, Decoder_Matcher_NoMatch)
{
    const auto events = abi::parseAbi(ERC20_ABI);
    ASSERT_TRUE(events.has_value());

    EXPECT_FALSE(decoder::matchEvent(crypto::constructEventTopicHex("Deposit(address,uint256)"), *events).has_value());
    EXPECT_FALSE(decoder::matchEvent("0x1234", *events).has_value());
    EXPECT_FALSE(decoder::matchEvent(TRANSFER_TOPIC, {}).has_value());
}

TEST_F(UnitTest, Decoder_Matcher_ComparesLowercasePrefixedText)
{
    const auto events = abi::parseAbi(ERC20_ABI);
    ASSERT_TRUE(events.has_value());

    std::string upper = TRANSFER_TOPIC;
    std::transform(upper.begin() + 2, upper.end(), upper.begin() + 2, [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    EXPECT_FALSE(decoder::matchEvent(upper, *events).has_value());

    const std::string unprefixed = std::string(TRANSFER_TOPIC).substr(2);
    EXPECT_FALSE(decoder::matchEvent(unprefixed, *events).has_value());

    std::string upper_prefix = TRANSFER_TOPIC;
    upper_prefix[1] = 'X';
    EXPECT_FALSE(decoder::matchEvent(upper_prefix, *events).has_value());
}

TEST_F(UnitTest, Decoder_Topics_IndexedInDeclarationOrder)
{
    const auto arguments = decoder::decodeTopics(transferDefinition(),
        {TRANSFER_TOPIC, topicForAddress(FROM), topicForAddress(TO)});
    ASSERT_TRUE(arguments.has_value());
    ASSERT_EQ(arguments->size(), 2u);
    EXPECT_EQ(arguments->at(0).name, "from");
    EXPECT_EQ(std::get<std::string>(arguments->at(0).value), chain::addressToHex(FROM));
    EXPECT_EQ(arguments->at(1).name, "to");
    EXPECT_EQ(std::get<std::string>(arguments->at(1).value), chain::addressToHex(TO));
}

TEST_F(UnitTest, Decoder_Topics_SlotFollowsParameterPosition)
{
    const auto events = abi::parseAbi(R"([{"type": "event", "name": "Staked", "inputs": [
        {"name": "amount", "type": "uint256"},
        {"name": "user", "type": "address", "indexed": true}
    ]}])");
    ASSERT_TRUE(events.has_value());
    const std::string staked_topic = crypto::constructEventTopicHex("Staked(uint256,address)");

    const auto arguments = decoder::decodeTopics(events->at(0),
        {staked_topic, topicForAddress(TO), topicForAddress(FROM)});
    ASSERT_TRUE(arguments.has_value());
    ASSERT_EQ(arguments->size(), 1u);
    EXPECT_EQ(arguments->at(0).name, "user");
    EXPECT_EQ(std::get<std::string>(arguments->at(0).value), chain::addressToHex(FROM));

    const auto short_topics = decoder::decodeTopics(events->at(0), {staked_topic, topicForAddress(FROM)});
    ASSERT_FALSE(short_topics.has_value());
    EXPECT_EQ(short_topics.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);
}

TEST_F(UnitTest, Decoder_Topics_NoIndexedInputs)
{
    const auto events = abi::parseAbi(R"([{"type": "event", "name": "Value", "inputs": [{"name": "v", "type": "uint256"}]}])");
    ASSERT_TRUE(events.has_value());

    const auto arguments = decoder::decodeTopics(events->at(0), {crypto::constructEventTopicHex("Value(uint256)")});
    ASSERT_TRUE(arguments.has_value());
    EXPECT_TRUE(arguments->empty());
}

TEST_F(UnitTest, Decoder_Topics_MissingTopicIsOutOfBounds)
{
    const auto arguments = decoder::decodeTopics(transferDefinition(), {TRANSFER_TOPIC, topicForAddress(FROM)});
    ASSERT_FALSE(arguments.has_value());
    EXPECT_EQ(arguments.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);
}

TEST_F(UnitTest, Decoder_Topics_SurplusOrInvalidTopicIsMalformed)
{
    const auto surplus = decoder::decodeTopics(transferDefinition(),
        {TRANSFER_TOPIC, topicForAddress(FROM), topicForAddress(TO), topicForAddress(TO)});
    ASSERT_FALSE(surplus.has_value());
    EXPECT_EQ(surplus.error().kind, decoder::Error::Kind::MALFORMED_INPUT);

    const auto invalid = decoder::decodeTopics(transferDefinition(), {TRANSFER_TOPIC, "0x01", topicForAddress(TO)});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().kind, decoder::Error::Kind::MALFORMED_INPUT);

    std::string upper_prefix = topicForAddress(FROM);
    upper_prefix[1] = 'X';
    const auto upper = decoder::decodeTopics(transferDefinition(), {TRANSFER_TOPIC, upper_prefix, topicForAddress(TO)});
    ASSERT_FALSE(upper.has_value());
    EXPECT_EQ(upper.error().kind, decoder::Error::Kind::MALFORMED_INPUT);
}

TEST_F(UnitTest, Decoder_Data_SlotsInDeclarationOrder)
{
    const auto events = abi::parseAbi(R"([{"type": "event", "name": "Mixed", "inputs": [
        {"name": "flag", "type": "bool"},
        {"name": "who", "type": "address", "indexed": true},
        {"name": "owner", "type": "address"},
        {"name": "note", "type": "string"},
        {"name": "amount", "type": "uint256"}
    ]}])");
    ASSERT_TRUE(events.has_value());

    const std::string data = concatWords({
        encodeBoolWord(true),
        encodeAddressWord(TO),
        encodeUint256Word(0x60),
        encodeUint256Word(42)
    });

    const auto arguments = decoder::decodeData(events->at(0), data);
    ASSERT_TRUE(arguments.has_value());
    ASSERT_EQ(arguments->size(), 4u);
    EXPECT_TRUE(std::get<bool>(arguments->at(0).value));
    EXPECT_EQ(std::get<std::string>(arguments->at(1).value), chain::addressToHex(TO));
    EXPECT_EQ(std::get<std::string>(arguments->at(2).value), "unsupported type: string");
    EXPECT_EQ(arguments->at(3).name, "amount");
    EXPECT_EQ(std::get<std::string>(arguments->at(3).value), "42");
}

TEST_F(UnitTest, Decoder_Data_AcceptsMissingPrefix)
{
    const std::string data = hexPrefixed(encodeUint256Word(7)).substr(2);
    const auto arguments = decoder::decodeData(transferDefinition(), data);
    ASSERT_TRUE(arguments.has_value());
    ASSERT_EQ(arguments->size(), 1u);
    EXPECT_EQ(std::get<std::string>(arguments->at(0).value), "7");
}

TEST_F(UnitTest, Decoder_Data_ShortBlobIsOutOfBounds)
{
    const std::string short_data = hexPrefixed(std::vector<std::uint8_t>(31, 0));
    const auto arguments = decoder::decodeData(transferDefinition(), short_data);
    ASSERT_FALSE(arguments.has_value());
    EXPECT_EQ(arguments.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);

    const auto empty = decoder::decodeData(transferDefinition(), "0x");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);
}

TEST_F(UnitTest, Decoder_Data_InvalidHexIsMalformed)
{
    const auto arguments = decoder::decodeData(transferDefinition(), "0xzz");
    ASSERT_FALSE(arguments.has_value());
    EXPECT_EQ(arguments.error().kind, decoder::Error::Kind::MALFORMED_INPUT);

    std::string upper_prefix = hexPrefixed(encodeUint256Word(7));
    upper_prefix[1] = 'X';
    const auto upper = decoder::decodeData(transferDefinition(), upper_prefix);
    ASSERT_FALSE(upper.has_value());
    EXPECT_EQ(upper.error().kind, decoder::Error::Kind::MALFORMED_INPUT);
}

TEST_F(UnitTest, Decoder_TransformLog_DecodesTransfer)
{
    config::ParameterStore store;
    const json input = makeTransferLog(1);

    const auto output = decoder::transformLog(input, configuredStore(store, ERC20_ABI));
    ASSERT_TRUE(output.has_value());

    EXPECT_EQ(output->at("hash"), input.at("transactionHash"));
    EXPECT_EQ(output->at("block"), "100");
    EXPECT_EQ(output->at("signature"), "Transfer(address,address,uint256)");
    EXPECT_EQ(output->at("logIndex"), "0x1");
    EXPECT_EQ(output->at("data"), input.at("data"));

    const json & arguments = output->at("arguments");
    ASSERT_TRUE(arguments.is_array());
    ASSERT_EQ(arguments.size(), 3u);
    EXPECT_EQ(arguments[0], (json{{"name", "from"}, {"type", "address"}, {"value", "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"}}));
    EXPECT_EQ(arguments[1], (json{{"name", "to"}, {"type", "address"}, {"value", "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"}}));
    EXPECT_EQ(arguments[2], (json{{"name", "value"}, {"type", "uint256"}, {"value", "1"}}));
}

TEST_F(UnitTest, Decoder_TransformLog_TopicArgumentsBeforeDataArguments)
{
    config::ParameterStore store;
    configuredStore(store, R"([{"type": "event", "name": "Flagged", "inputs": [
        {"name": "active", "type": "bool"},
        {"name": "user", "type": "address", "indexed": true}
    ]}])");

    const json input = {
        {"transactionHash", "0x01"},
        {"blockNumber", "0x10"},
        {"topics", json::array({crypto::constructEventTopicHex("Flagged(bool,address)"), topicForAddress(TO), topicForAddress(FROM)})},
        {"data", hexPrefixed(encodeBoolWord(false))}
    };

    const auto output = decoder::transformLog(input, store);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->at("block"), "16");

    const json & arguments = output->at("arguments");
    ASSERT_EQ(arguments.size(), 2u);
    EXPECT_EQ(arguments[0].at("name"), "user");
    EXPECT_EQ(arguments[0].at("value"), chain::addressToHex(FROM));
    EXPECT_EQ(arguments[1].at("name"), "active");
    EXPECT_EQ(arguments[1].at("value"), false);
}

TEST_F(UnitTest, Decoder_TransformLog_NotConfigured)
{
    config::ParameterStore store;
    const auto output = decoder::transformLog(makeTransferLog(1), store);
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().kind, decoder::Error::Kind::NOT_CONFIGURED);
}

TEST_F(UnitTest, Decoder_TransformLog_MalformedAbiPassesThrough)
{
    config::ParameterStore store;
    const json input = makeTransferLog(1);

    const auto output = decoder::transformLog(input, configuredStore(store, "{ this is not an abi"));
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, input);
}

TEST_F(UnitTest, Decoder_TransformLog_NoMatchPassesThrough)
{
    config::ParameterStore store;
    json input = makeTransferLog(1);
    input["topics"][0] = crypto::constructEventTopicHex("Deposit(address,uint256)");

    const auto output = decoder::transformLog(input, configuredStore(store, ERC20_ABI));
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, input);
}

TEST_F(UnitTest, Decoder_TransformLog_NonCanonicalTopicZeroPassesThrough)
{
    config::ParameterStore store;
    configuredStore(store, ERC20_ABI);

    json upper = makeTransferLog(1);
    std::string topic0 = TRANSFER_TOPIC;
    std::transform(topic0.begin() + 2, topic0.end(), topic0.begin() + 2, [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    upper["topics"][0] = topic0;
    const auto upper_output = decoder::transformLog(upper, store);
    ASSERT_TRUE(upper_output.has_value());
    EXPECT_EQ(*upper_output, upper);

    json unprefixed = makeTransferLog(1);
    unprefixed["topics"][0] = std::string(TRANSFER_TOPIC).substr(2);
    const auto unprefixed_output = decoder::transformLog(unprefixed, store);
    ASSERT_TRUE(unprefixed_output.has_value());
    EXPECT_EQ(*unprefixed_output, unprefixed);
}

TEST_F(UnitTest, Decoder_TransformLog_ShortDataIsOutOfBounds)
{
    config::ParameterStore store;
    json input = makeTransferLog(1);
    input["data"] = "0x";

    const auto output = decoder::transformLog(input, configuredStore(store, ERC20_ABI));
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);
}

TEST_F(UnitTest, Decoder_TransformLog_MissingTopicsIsMalformed)
{
    config::ParameterStore store;
    configuredStore(store, ERC20_ABI);

    json input = makeTransferLog(1);
    input.erase("topics");
    const auto missing = decoder::transformLog(input, store);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, decoder::Error::Kind::MALFORMED_INPUT);

    input["topics"] = json::array({1, 2});
    const auto wrong_type = decoder::transformLog(input, store);
    ASSERT_FALSE(wrong_type.has_value());
    EXPECT_EQ(wrong_type.error().kind, decoder::Error::Kind::MALFORMED_INPUT);

    input["topics"] = json::array();
    const auto empty = decoder::transformLog(input, store);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, decoder::Error::Kind::OUT_OF_BOUNDS);
}

TEST_F(UnitTest, Decoder_TransformLog_UsesLatestAbi)
{
    config::ParameterStore store;
    const json input = makeTransferLog(5);

    const auto before = decoder::transformLog(input, configuredStore(store, "[]"));
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(before->contains("signature"));

    const auto after = decoder::transformLog(input, configuredStore(store, ERC20_ABI));
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->at("signature"), "Transfer(address,address,uint256)");
}

TEST_F(UnitTest, Decoder_LogRecord_ParseFromJson)
{
    const auto record = parse::parseFromJson<decoder::LogRecord>(makeTransferLog(1), parse::use_json);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->block_number, 100u);
    EXPECT_EQ(record->topics.size(), 3u);

    json negative = makeTransferLog(1);
    negative["blockNumber"] = -1;
    EXPECT_FALSE(parse::parseFromJson<decoder::LogRecord>(negative, parse::use_json).has_value());

    json hex_block = makeTransferLog(1);
    hex_block["blockNumber"] = "0xff";
    const auto hex_record = parse::parseFromJson<decoder::LogRecord>(hex_block, parse::use_json);
    ASSERT_TRUE(hex_record.has_value());
    EXPECT_EQ(hex_record->block_number, 255u);

    json bad_hash = makeTransferLog(1);
    bad_hash["transactionHash"] = 12;
    EXPECT_FALSE(parse::parseFromJson<decoder::LogRecord>(bad_hash, parse::use_json).has_value());
}

TEST_F(UnitTest, Decoder_LogRecord_ErrorsNameTheField)
{
    json bad_topic = makeTransferLog(1);
    bad_topic["topics"][2] = 7;
    const auto topic_res = parse::parseFromJson<decoder::LogRecord>(bad_topic, parse::use_json);
    ASSERT_FALSE(topic_res.has_value());
    EXPECT_EQ(topic_res.error().kind, parse::Error::Kind::TYPE_MISMATCH);
    EXPECT_EQ(topic_res.error().field, "topics[2]");

    json no_topics = makeTransferLog(1);
    no_topics.erase("topics");
    const auto missing_res = parse::parseFromJson<decoder::LogRecord>(no_topics, parse::use_json);
    ASSERT_FALSE(missing_res.has_value());
    EXPECT_EQ(missing_res.error().kind, parse::Error::Kind::MISSING_FIELD);
    EXPECT_EQ(missing_res.error().field, "topics");

    json bad_quantity = makeTransferLog(1);
    bad_quantity["blockNumber"] = "0xzz";
    const auto quantity_res = parse::parseFromJson<decoder::LogRecord>(bad_quantity, parse::use_json);
    ASSERT_FALSE(quantity_res.has_value());
    EXPECT_EQ(quantity_res.error().kind, parse::Error::Kind::INVALID_QUANTITY);
    EXPECT_EQ(std::format("{}", quantity_res.error()), "Invalid quantity at blockNumber: expected a hex quantity such as 0x1b4");
}

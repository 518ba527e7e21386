/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../coinuri/uri/CoinUri.hpp"
#include <catch2/catch.hpp>
#include <sstream>

using namespace coinuri;

#define BTC_ADDRESS "1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2"
#define BTC_TEST_ADDRESS "mrS8eVKXguwufwvsVe9GtgGb7fif9UQeAu"
#define LTC_ADDRESS "LW98ceYNxYki9e9QxDACLn82TtVEPm4qmy"
#define PPC_ADDRESS "PKWMWQdPvozqsg8289VRjf2XsRHqJhXFTm"

static CoinTypePtr
builtinCoin(const std::string &id)
{
    CoinTypePtr out;
    REQUIRE(CoinRegistry::builtin().coin(out, id));
    return out;
}

static CoinTypePtr
makeCoin(const std::string &id, uint8_t addressHeader, uint8_t p2shHeader)
{
    auto out = std::make_shared<CoinType>();
    out->id = id;
    out->name = id;
    out->symbol = id;
    out->uriScheme = "shared";
    out->addressHeader = addressHeader;
    out->p2shHeader = p2shHeader;
    out->unitExponent = 8;
    return out;
}

static tCU_CC
decodeError(const std::string &text)
{
    CoinUri uri;
    return CoinUri::decode(uri, text, CoinRegistry::builtin()).value();
}

TEST_CASE("Basic payment URI", "[uri]")
{
    const auto registry = CoinRegistry::builtin();
    CoinUri uri;

    SECTION("address only")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "bitcoin.main");
        REQUIRE(uri.addressOk());
        REQUIRE(uri.address().encoded() == BTC_ADDRESS);
        REQUIRE(!uri.amountOk());
        REQUIRE(!uri.labelOk());
        REQUIRE(!uri.messageOk());
        REQUIRE(!uri.paymentRequestUrlOk());
        REQUIRE(1 == uri.fields().size());
    }
    SECTION("all the fields")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?amount=0.1&label=Tacos&message=Lunch%20money"
                                "&r=https://example.com/pay", registry));
        REQUIRE(uri.amountOk());
        REQUIRE(10000000 == uri.amount().value());
        REQUIRE(uri.amount().coin() == uri.coin());
        REQUIRE(uri.label() == "Tacos");
        REQUIRE(uri.message() == "Lunch money");
        REQUIRE(uri.paymentRequestUrl() == "https://example.com/pay");
    }
    SECTION("double slash")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin://" BTC_ADDRESS "?amount=1",
                                registry));
        REQUIRE(uri.address().encoded() == BTC_ADDRESS);
        REQUIRE(100000000 == uri.amount().value());
    }
    SECTION("zero amount")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS "?amount=0",
                                registry));
        REQUIRE(uri.amountOk());
        REQUIRE(0 == uri.amount().value());
    }
    SECTION("other coins")
    {
        REQUIRE(CoinUri::decode(uri, "litecoin:" LTC_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "litecoin.main");

        REQUIRE(CoinUri::decode(uri, "peercoin:" PPC_ADDRESS "?amount=0.000001",
                                registry));
        REQUIRE(uri.coin()->id == "peercoin.main");
        REQUIRE(1 == uri.amount().value());

        REQUIRE(CoinUri::decode(uri, "parkbyte:" PPC_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "parkbyte.main");
    }
}

TEST_CASE("Coin resolution", "[uri]")
{
    CoinUri uri;

    SECTION("later candidate")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_TEST_ADDRESS "?amount=1",
                                CoinRegistry::builtin()));
        REQUIRE(uri.coin()->id == "bitcoin.test");
        REQUIRE(uri.address().coin()->id == "bitcoin.test");
        REQUIRE(uri.amount().coin()->id == "bitcoin.test");
    }
    SECTION("custom shared scheme")
    {
        CoinRegistry registry;
        REQUIRE(registry.add(makeCoin("a", 0, 5)));
        REQUIRE(registry.add(makeCoin("b", 111, 196)));

        REQUIRE(CoinUri::decode(uri, "shared:" BTC_TEST_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "b");
        REQUIRE(CoinUri::decode(uri, "shared:" BTC_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "a");
    }
    SECTION("first match wins")
    {
        CoinRegistry registry;
        REQUIRE(registry.add(makeCoin("first", 0, 5)));
        REQUIRE(registry.add(makeCoin("second", 0, 5)));

        REQUIRE(CoinUri::decode(uri, "shared:" BTC_ADDRESS, registry));
        REQUIRE(uri.coin()->id == "first");
    }
    SECTION("given coin")
    {
        const auto bitcoin = builtinCoin("bitcoin.main");
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS, bitcoin));
        REQUIRE(uri.coin() == bitcoin);

        const auto s = CoinUri::decode(uri, "bitcoin:" BTC_TEST_ADDRESS, bitcoin);
        REQUIRE(CU_CC_InvalidAddress == s.value());
    }
    SECTION("given coin, other scheme")
    {
        const auto s = CoinUri::decode(uri, "litecoin:" LTC_ADDRESS,
                                       builtinCoin("bitcoin.main"));
        REQUIRE(CU_CC_UnsupportedScheme == s.value());
    }
    SECTION("no coin given")
    {
        REQUIRE(CU_CC_NULLPtr ==
                CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS, nullptr).value());
    }
}

TEST_CASE("Payment request URIs", "[uri]")
{
    CoinUri uri;

    SECTION("no address")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:?r=https://example.com/pay/7",
                                CoinRegistry::builtin()));
        REQUIRE(!uri.coin());
        REQUIRE(!uri.addressOk());
        REQUIRE(!uri.address());
        REQUIRE(uri.paymentRequestUrl() == "https://example.com/pay/7");
    }
    SECTION("amount needs a coin")
    {
        REQUIRE(CU_CC_AmbiguousCurrency ==
                decodeError("bitcoin:?r=https://example.com&amount=1"));
    }
    SECTION("amount with a given coin")
    {
        const auto bitcoin = builtinCoin("bitcoin.main");
        REQUIRE(CoinUri::decode(uri, "bitcoin:?amount=1&r=https://example.com",
                                bitcoin));
        REQUIRE(uri.coin() == bitcoin);
        REQUIRE(100000000 == uri.amount().value());
    }
    SECTION("nowhere to pay")
    {
        REQUIRE(CU_CC_MissingDestination == decodeError("bitcoin:"));
        REQUIRE(CU_CC_MissingDestination == decodeError("bitcoin:?label=x"));
        REQUIRE(CU_CC_MissingDestination == decodeError("bitcoin:?r="));
    }
}

TEST_CASE("Parameter rules", "[uri]")
{
    const auto registry = CoinRegistry::builtin();
    CoinUri uri;

    SECTION("case-insensitive names")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?AMOUNT=2&Label=x", registry));
        REQUIRE(200000000 == uri.amount().value());
        REQUIRE(uri.label() == "x");
    }
    SECTION("unknown parameters are kept")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?somethingyoudontunderstand=50"
                                "&another=a%26b", registry));
        REQUIRE(uri.get("somethingyoudontunderstand"));
        REQUIRE(*uri.get("SomethingYouDontUnderstand")->text() == "50");
        REQUIRE(*uri.get("another")->text() == "a&b");
        REQUIRE(!uri.get("missing"));
    }
    SECTION("empty values are ignored")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?label=&label=Tacos&message=", registry));
        REQUIRE(uri.label() == "Tacos");
        REQUIRE(!uri.messageOk());
    }
    SECTION("trailing separator")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS "?amount=1&",
                                registry));
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS "?", registry));
    }
    SECTION("field order")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?z=1&label=x&amount=1", registry));
        const auto &fields = uri.fields();
        REQUIRE(4 == fields.size());
        REQUIRE(fields[0].first == CU_FIELD_ADDRESS);
        REQUIRE(fields[1].first == "z");
        REQUIRE(fields[2].first == CU_FIELD_LABEL);
        REQUIRE(fields[3].first == CU_FIELD_AMOUNT);
        REQUIRE(fields[0].second.kind() == FieldValue::Kind::address);
        REQUIRE(fields[3].second.kind() == FieldValue::Kind::amount);
    }
    SECTION("address parameter")
    {
        REQUIRE(CU_CC_DuplicateField ==
                decodeError("bitcoin:" BTC_ADDRESS "?address=x"));

        REQUIRE(CoinUri::decode(uri, "bitcoin:?r=https://example.com"
                                "&address=x", registry));
        REQUIRE(!uri.addressOk());
        REQUIRE(*uri.get("address")->text() == "x");
    }
}

TEST_CASE("Text decoding", "[uri]")
{
    const auto registry = CoinRegistry::builtin();
    CoinUri uri;

    SECTION("escaped separators")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?label=Tom%20%26%20Jerry", registry));
        REQUIRE(uri.label() == "Tom & Jerry");
    }
    SECTION("plus is a space")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?message=Thanks+for+lunch", registry));
        REQUIRE(uri.message() == "Thanks for lunch");
    }
    SECTION("utf-8")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?label=caf%C3%A9", registry));
        REQUIRE(uri.label() == "caf\xc3\xa9");
    }
    SECTION("raw utf-8")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?label=Caf\xc3\xa9", registry));
        REQUIRE(uri.label() == "Caf\xc3\xa9");
    }
    SECTION("bad utf-8 escapes")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?label=%FFx", registry));
        REQUIRE(uri.label() == "\xef\xbf\xbdx");
    }
    SECTION("ipv6 request link")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:?r=https://[::1]/pay",
                                registry));
        REQUIRE(uri.paymentRequestUrl() == "https://[::1]/pay");
    }
    SECTION("escaped request link")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:?r="
                                "https%3A%2F%2Fexample.com%2Fpay%3Fid%3D7",
                                registry));
        REQUIRE(uri.paymentRequestUrl() == "https://example.com/pay?id=7");
    }
}

TEST_CASE("Rejected URIs", "[uri]")
{
    SECTION("syntax")
    {
        REQUIRE(CU_CC_SyntaxError == decodeError(""));
        REQUIRE(CU_CC_SyntaxError == decodeError(BTC_ADDRESS));
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?label=a b"));
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?label=%zz"));
    }
    SECTION("question marks")
    {
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?a=1?b=2"));
    }
    SECTION("malformed pairs")
    {
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount"));
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?=1"));
        REQUIRE(CU_CC_SyntaxError ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount=1&&label=x"));
    }
    SECTION("scheme")
    {
        REQUIRE(CU_CC_UnsupportedScheme == decodeError("http://example.com"));
        REQUIRE(CU_CC_UnsupportedScheme == decodeError("namecoin:" BTC_ADDRESS));
        REQUIRE(CU_CC_UnsupportedScheme == decodeError("BITCOIN:" BTC_ADDRESS));
    }
    SECTION("address")
    {
        REQUIRE(CU_CC_InvalidAddress == decodeError("bitcoin:" LTC_ADDRESS));
        REQUIRE(CU_CC_InvalidAddress == decodeError("bitcoin:tacos"));
        REQUIRE(CU_CC_InvalidAddress ==
                decodeError("bitcoin:1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN3"));
    }
    SECTION("duplicates")
    {
        REQUIRE(CU_CC_DuplicateField ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount=1&amount=1"));
        REQUIRE(CU_CC_DuplicateField ==
                decodeError("bitcoin:" BTC_ADDRESS "?label=a&LABEL=b"));
    }
    SECTION("required parameters")
    {
        REQUIRE(CU_CC_RequiredFieldUnknown ==
                decodeError("bitcoin:" BTC_ADDRESS "?req-expires=600"));
        REQUIRE(CU_CC_RequiredFieldUnknown ==
                decodeError("bitcoin:" BTC_ADDRESS "?REQ-x="));
    }
    SECTION("amounts")
    {
        REQUIRE(CU_CC_InvalidAmount ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount=abc"));
        REQUIRE(CU_CC_InvalidAmount ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount="));
        REQUIRE(CU_CC_PrecisionError ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount=0.000000001"));
        REQUIRE(CU_CC_PrecisionError ==
                decodeError("peercoin:" PPC_ADDRESS "?amount=0.0000001"));
        REQUIRE(CU_CC_NegativeAmount ==
                decodeError("bitcoin:" BTC_ADDRESS "?amount=-1"));
    }
    SECTION("failure leaves the output alone")
    {
        CoinUri uri;
        const auto registry = CoinRegistry::builtin();
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS "?label=Tacos",
                                registry));
        REQUIRE(!CoinUri::decode(uri, "litecoin:" LTC_ADDRESS "?amount=-1",
                                 registry));
        REQUIRE(uri.coin()->id == "bitcoin.main");
        REQUIRE(uri.label() == "Tacos");
    }
    SECTION("error messages")
    {
        CoinUri uri;
        const auto s = CoinUri::decode(uri,
                                       "bitcoin:" BTC_ADDRESS "?req-expires=600",
                                       CoinRegistry::builtin());
        REQUIRE(s.message() ==
                "'req-expires' is required but not known, this URI is not valid");
    }
}

TEST_CASE("Building URIs", "[uri]")
{
    const auto bitcoin = builtinCoin("bitcoin.main");
    UriRequest request;
    REQUIRE(addressDecode(request.address, bitcoin, BTC_ADDRESS));
    std::string out;

    SECTION("address only")
    {
        REQUIRE(uriEncode(out, request));
        REQUIRE(out == "bitcoin:" BTC_ADDRESS);
    }
    SECTION("every field")
    {
        request.amountOk = true;
        request.amount = Amount(bitcoin, 10000000);
        request.label = "Tom & Jerry";
        request.message = "Thanks!";
        REQUIRE(uriEncode(out, request));
        REQUIRE(out == "bitcoin:" BTC_ADDRESS
                "?amount=0.1&label=Tom%20%26%20Jerry&message=Thanks%21");
    }
    SECTION("zero amount")
    {
        request.amountOk = true;
        request.amount = Amount(bitcoin, 0);
        REQUIRE(uriEncode(out, request));
        REQUIRE(out == "bitcoin:" BTC_ADDRESS "?amount=0");
    }
    SECTION("message only")
    {
        request.message = "a+b=c?";
        REQUIRE(uriEncode(out, request));
        REQUIRE(out == "bitcoin:" BTC_ADDRESS "?message=a%2Bb%3Dc%3F");
    }
    SECTION("coin precision")
    {
        const auto peercoin = builtinCoin("peercoin.main");
        REQUIRE(addressDecode(request.address, peercoin, PPC_ADDRESS));
        request.amountOk = true;
        request.amount = Amount(peercoin, 1500000);
        REQUIRE(uriEncode(out, request));
        REQUIRE(out == "peercoin:" PPC_ADDRESS "?amount=1.5");
    }
    SECTION("negative amount")
    {
        request.amountOk = true;
        request.amount = Amount(bitcoin, -1);
        REQUIRE(CU_CC_InvalidArgument == uriEncode(out, request).value());
        REQUIRE(out.empty());
    }
    SECTION("mismatched amount")
    {
        request.amountOk = true;
        request.amount = Amount(builtinCoin("litecoin.main"), 1);
        REQUIRE(CU_CC_InvalidArgument == uriEncode(out, request).value());
    }
    SECTION("no address")
    {
        REQUIRE(CU_CC_InvalidArgument ==
                uriEncode(out, UriRequest()).value());
    }
}

TEST_CASE("Building and parsing agree", "[uri]")
{
    const auto registry = CoinRegistry::builtin();
    const auto bitcoinTest = builtinCoin("bitcoin.test");

    UriRequest request;
    REQUIRE(addressDecode(request.address, bitcoinTest, BTC_TEST_ADDRESS));
    request.amountOk = true;
    request.amount = Amount(bitcoinTest, 123456789);
    request.label = "Tom & Jerry";
    request.message = "caf\xc3\xa9 100% a+b=c?";

    std::string text;
    REQUIRE(uriEncode(text, request));

    CoinUri uri;
    REQUIRE(CoinUri::decode(uri, text, registry));
    REQUIRE(uri.address() == request.address);
    REQUIRE(uri.amount() == request.amount);
    REQUIRE(uri.label() == request.label);
    REQUIRE(uri.message() == request.message);

    std::string again;
    REQUIRE(uri.encode(again));
    REQUIRE(again == text);
}

TEST_CASE("Re-encoding parsed URIs", "[uri]")
{
    const auto registry = CoinRegistry::builtin();
    CoinUri uri;
    std::string out;

    SECTION("canonical form")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin://" BTC_ADDRESS
                                "?foo=bar&Label=x&amount=1.50", registry));
        REQUIRE(uri.encode(out));
        REQUIRE(out == "bitcoin:" BTC_ADDRESS "?amount=1.5&label=x");
    }
    SECTION("no address")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:?r=https://example.com",
                                registry));
        REQUIRE(CU_CC_InvalidArgument == uri.encode(out).value());
    }
    SECTION("debug description")
    {
        REQUIRE(CoinUri::decode(uri, "bitcoin:" BTC_ADDRESS
                                "?amount=0.1&label=Tacos", registry));
        std::ostringstream stream;
        stream << uri;
        REQUIRE(stream.str() == "CoinURI['address'='" BTC_ADDRESS "',"
                "'amount'='0.1','label'='Tacos']");
    }
}

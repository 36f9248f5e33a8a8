#include <gtest/gtest.h>

#include "propbag.h"

#include <QJsonDocument>
#include <QJsonObject>

static QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

// ─── Building ───────────────────────────────────────────────────────────────

TEST(PropBag, SetReplacesSameSlot) {
    PropBag bag;
    bag.set(QStringLiteral("m"), QStringLiteral("sm"))
       .set(QStringLiteral("m"), QStringLiteral("md"))
       .set(QStringLiteral("m"), QStringLiteral("lg"), PseudoState::Hover);

    EXPECT_EQ(bag.entries().size(), 2);
    EXPECT_EQ(bag.value(QStringLiteral("m")), StyleValue(QStringLiteral("md")));
    EXPECT_EQ(bag.value(QStringLiteral("m"), PseudoState::Hover), StyleValue(QStringLiteral("lg")));
}

// ─── JSON ───────────────────────────────────────────────────────────────────

TEST(PropBag, FromJsonReadsAllLevels) {
    const PropBag bag = PropBag::fromJson(parse(R"({
        "m": "md",
        "w": { "base": 100, "lg": 300 },
        ":hover": { "bg": "gray.1" },
        "styles": { "label": { "c": "dimmed", ":disabled": { "c": "gray.4" } } },
        "style": { "qproperty-indent": 4 }
    })"));

    EXPECT_EQ(bag.value(QStringLiteral("m")), StyleValue(QStringLiteral("md")));
    EXPECT_TRUE(bag.value(QStringLiteral("w")).isResponsive());
    EXPECT_EQ(bag.value(QStringLiteral("bg"), PseudoState::Hover),
              StyleValue(QStringLiteral("gray.1")));
    EXPECT_EQ(bag.value(QStringLiteral("c"), PseudoState::None, QStringLiteral("label")),
              StyleValue(QStringLiteral("dimmed")));
    EXPECT_EQ(bag.value(QStringLiteral("c"), PseudoState::Disabled, QStringLiteral("label")),
              StyleValue(QStringLiteral("gray.4")));

    bool foundRaw = false;
    for (const PropBag::Entry &e : bag.entries()) {
        if (e.raw) {
            foundRaw = true;
            EXPECT_EQ(e.name, QStringLiteral("qproperty-indent"));
            EXPECT_EQ(e.value, StyleValue(4));
        }
    }
    EXPECT_TRUE(foundRaw);
    EXPECT_TRUE(bag.isResponsive());
}

TEST(PropBag, JsonShapeSurvivesRoundTrip) {
    const QJsonObject json = parse(R"({
        "p": "sm",
        ":focus": { "bdc": "primary" },
        "styles": { "icon": { "w": 16 } },
        "style": { "outline": "none" }
    })");
    const PropBag bag = PropBag::fromJson(json);
    EXPECT_EQ(bag.toJson(), json);
}

TEST(PropBag, MalformedJsonIsRejected) {
    const char *bad[] = {
        R"({ "m": true })",
        R"({ "m": null })",
        R"({ "w": { "base": [1] } })",
        R"({ "w": {} })",
        R"({ ":hover": "gray.1" })",
        R"({ ":hover": { ":focus": { "c": "red.6" } } })",
        R"({ ":pressed": { "c": "red.6" } })",
        R"({ "styles": { "label": "dimmed" } })",
        R"({ "styles": { "label": { "styles": { "icon": { "w": 4 } } } } })",
        R"({ "style": 4 })",
    };
    for (const char *json : bad) {
        StyleError error;
        const PropBag bag = PropBag::fromJson(parse(json), &error);
        EXPECT_TRUE(bag.isEmpty()) << json;
        EXPECT_EQ(error.kind(), StyleError::Validation) << json;
    }
}

TEST(PropBag, WellFormedJsonReportsNoError) {
    StyleError error;
    const PropBag bag = PropBag::fromJson(parse(R"({ "m": "md", ":focus": { "bdc": "primary" } })"),
                                          &error);
    EXPECT_FALSE(error.isError());
    EXPECT_EQ(bag.entries().size(), 2);
}

// ─── Fingerprints ───────────────────────────────────────────────────────────

TEST(PropBag, FingerprintIgnoresInsertionOrder) {
    PropBag a;
    a.set(QStringLiteral("m"), QStringLiteral("md")).set(QStringLiteral("c"), QStringLiteral("blue.6"));
    PropBag b;
    b.set(QStringLiteral("c"), QStringLiteral("blue.6")).set(QStringLiteral("m"), QStringLiteral("md"));
    EXPECT_EQ(a.fingerprint(), b.fingerprint());
    EXPECT_TRUE(a == b);

    b.set(QStringLiteral("m"), QStringLiteral("lg"));
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST(PropBag, FingerprintDistinguishesNumberFromString) {
    PropBag a;
    a.set(QStringLiteral("w"), 100);
    PropBag b;
    b.set(QStringLiteral("w"), QStringLiteral("100"));
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST(PropBag, MergeOverridesMatchingEntries) {
    PropBag base;
    base.set(QStringLiteral("m"), QStringLiteral("sm")).set(QStringLiteral("c"), QStringLiteral("red.6"));
    PropBag over;
    over.set(QStringLiteral("m"), QStringLiteral("xl"));

    base.merge(over);
    EXPECT_EQ(base.value(QStringLiteral("m")), StyleValue(QStringLiteral("xl")));
    EXPECT_EQ(base.value(QStringLiteral("c")), StyleValue(QStringLiteral("red.6")));
}

/**
 * @file subtitleprocessor_test.cpp
 * @brief Unit tests for the subtitle stage
 *
 * Covers rule loading, the ASS/SRT rewriter and SubtitleProcessor driven by a
 * fake MuxTool, plus the mkvmerge identification parser.
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "mkvtoolnixmuxtool.h"
#include "replacementrules.h"
#include "subtitleprocessor.h"
#include "subtitlerewriter.h"

namespace
{
const char* kAssSample = "[Script Info]\n"
                         "Title: Sample\n"
                         "\n"
                         "[V4+ Styles]\n"
                         "Format: Name, Fontname, Fontsize\n"
                         "Style: Default,Arial,20\n"
                         "\n"
                         "[Events]\n"
                         "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n"
                         "Dialogue: 0,0:00:01.00,0:00:02.00,Default,,0,0,0,,{\\i1}Colour, colour{\\i0} again\n"
                         "Comment: 0,0:00:01.00,0:00:02.00,Default,,0,0,0,,Colour\n";

QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}

bool writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    return file.write(data) == data.size();
}

class FakeMuxTool : public MuxTool
{
public:
    bool hasTrack = true;
    bool remuxSucceeds = true;
    bool remuxWritesOutput = true;
    QByteArray subtitle = kAssSample;
    QByteArray remuxedSubtitle;
    RemuxOptions lastOptions;

    bool findSubtitleTrack(const QString&, int preferredId, SubtitleTrackInfo* track, QString* errorOut) override
    {
        if (!hasTrack)
        {
            if (errorOut)
                *errorOut = "No text subtitle track found";
            return false;
        }
        track->id = preferredId >= 0 ? preferredId : 2;
        track->codecId = "S_TEXT/ASS";
        track->extension = "ass";
        return true;
    }

    bool extractSubtitle(const QString&, const SubtitleTrackInfo&, const QString& outputPath, QString*) override
    {
        return writeFile(outputPath, subtitle);
    }

    bool remuxSubtitle(const QString& mediaPath, const QString& subtitlePath, const RemuxOptions& options,
                       const QString& outputPath, QString* errorOut) override
    {
        lastOptions = options;
        remuxedSubtitle = readFile(subtitlePath);
        if (!remuxSucceeds)
        {
            if (errorOut)
                *errorOut = "mkvmerge failed (exit code 2)";
            // A failing tool may still leave a half written output behind
            writeFile(outputPath, "garbage");
            return false;
        }
        if (!remuxWritesOutput)
            return writeFile(outputPath, QByteArray());
        return writeFile(outputPath, readFile(mediaPath) + "+remuxed");
    }
};
}

class SubtitleProcessorTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void testApplyRules_chaining();
    void testApplyRules_secondPassChangesTextAgain();
    void testApplyRules_literalNotRegex();
    void testApplyRulesOutsideOverrides();
    void testRewriteAss_onlyDialogueText();
    void testRewriteSrt_onlyTextLines();
    void testStandardRules();

    void testParseRules_valid();
    void testParseRules_invalid();
    void testLoadFromSource_localFile();

    void testProcess_appliesAndReplacesMedia();
    void testProcess_muxFailureLeavesMediaUntouched();
    void testProcess_emptyOutputLeavesMediaUntouched();
    void testProcess_noSubtitleTrack();
    void testProcess_noRulesNotApplicable();

    void testMkvToolNix_parseIdentification();
    void testMkvToolNix_remuxArguments();

private:
    QStringList visibleAndHiddenFiles() const;

    QTemporaryDir m_dir;
    QString m_mediaPath;
};

void SubtitleProcessorTest::init()
{
    QVERIFY(m_dir.isValid());
    const QDir dir(m_dir.path());
    for (const QString& name : dir.entryList(QDir::Files | QDir::Hidden))
        QFile::remove(dir.filePath(name));
    m_mediaPath = dir.filePath("Show S01E01.mkv");
    QVERIFY(writeFile(m_mediaPath, "original media"));
}

QStringList SubtitleProcessorTest::visibleAndHiddenFiles() const
{
    return QDir(m_dir.path()).entryList(QDir::Files | QDir::Hidden);
}

/** @brief Test: [("A","B"),("B","C")] applied to "A" gives "C". */
void SubtitleProcessorTest::testApplyRules_chaining()
{
    const ReplacementRuleList rules = {{"A", "B"}, {"B", "C"}};
    QCOMPARE(SubtitleRewriter::applyRules("A", rules), QString("C"));
    QCOMPARE(SubtitleRewriter::applyRules("AAB", rules), QString("CCC"));
}

/** @brief Test: rules whose output contains their own input are not idempotent. */
void SubtitleProcessorTest::testApplyRules_secondPassChangesTextAgain()
{
    const ReplacementRuleList growing = {ReplacementRule{"a", "ab"}};
    const QString once = SubtitleRewriter::applyRules("a", growing);
    const QString twice = SubtitleRewriter::applyRules(once, growing);
    QCOMPARE(once, QString("ab"));
    QCOMPARE(twice, QString("abb"));
    QVERIFY(once != twice);

    // The built-in line break rule widens the gap on every pass
    const ReplacementRuleList standard = ReplacementRules::standardRules();
    const QString first = SubtitleRewriter::applyRules("one\\Ntwo", standard);
    const QString second = SubtitleRewriter::applyRules(first, standard);
    QCOMPARE(first, QString("one\\N two"));
    QCOMPARE(second, QString("one\\N  two"));
}

void SubtitleProcessorTest::testApplyRules_literalNotRegex()
{
    const ReplacementRuleList rules = {{"a.c", "x"}, {"(", "["}};
    QCOMPARE(SubtitleRewriter::applyRules("abc a.c (", rules), QString("abc x ["));
}

/** @brief Test: override tags are markup and never rewritten. */
void SubtitleProcessorTest::testApplyRulesOutsideOverrides()
{
    const ReplacementRuleList rules = {{"pos", "POS"}, {"i1", "I1"}};
    QCOMPARE(SubtitleRewriter::applyRulesOutsideOverrides("{\\pos(10,10)\\i1}pos i1{\\i0}pos", rules),
             QString("{\\pos(10,10)\\i1}POS I1{\\i0}POS"));
    QCOMPARE(SubtitleRewriter::applyRulesOutsideOverrides("pos {\\i1 unterminated pos", rules),
             QString("POS {\\i1 unterminated pos"));
}

void SubtitleProcessorTest::testRewriteAss_onlyDialogueText()
{
    const ReplacementRuleList rules = {{"Colour", "Color"}, {"colour", "color"}, {"Default", "X"}};
    int changed = -1;
    const QString result = SubtitleRewriter::rewriteAss(QString::fromUtf8(kAssSample), rules, &changed);

    QCOMPARE(changed, 1);
    QVERIFY(result.contains("Dialogue: 0,0:00:01.00,0:00:02.00,Default,,0,0,0,,{\\i1}Color, color{\\i0} again\n"));
    QVERIFY(result.contains("Comment: 0,0:00:01.00,0:00:02.00,Default,,0,0,0,,Colour\n"));
    QVERIFY(result.contains("Style: Default,Arial,20\n"));
}

void SubtitleProcessorTest::testRewriteSrt_onlyTextLines()
{
    const QString srt = "1\r\n"
                        "00:00:01,000 --> 00:00:02,000\r\n"
                        "1 apple, 2 apples\r\n"
                        "\r\n"
                        "2\r\n"
                        "00:00:03,000 --> 00:00:04,000\r\n"
                        "2\r\n";
    const ReplacementRuleList rules = {{"1", "one"}, {"2", "two"}, {"0", "zero"}};
    int changed = 0;
    const QString result = SubtitleRewriter::rewriteSrt(srt, rules, &changed);

    QCOMPARE(changed, 2);
    QCOMPARE(result, QString("1\r\n"
                             "00:00:01,000 --> 00:00:02,000\r\n"
                             "one apple, two apples\r\n"
                             "\r\n"
                             "2\r\n"
                             "00:00:03,000 --> 00:00:04,000\r\n"
                             "two\r\n"));
}

void SubtitleProcessorTest::testStandardRules()
{
    const ReplacementRuleList rules = ReplacementRules::standardRules();
    QCOMPARE(rules.first().oldText, QString("Wh-wh"));
    QCOMPARE(rules.first().newText, QString("W-Wh"));

    bool hasV = false;
    bool hasA = false;
    for (const ReplacementRule& rule : rules)
    {
        hasV = hasV || rule.oldText == "V-v";
        hasA = hasA || (rule.oldText == "A-a" && rule.newText == "A-A");
    }
    QVERIFY(hasA);
    QVERIFY(!hasV);

    QCOMPARE(SubtitleRewriter::applyRules("Wh-what? B-but\\Nnext\\hsp", rules),
             QString("W-What? B-But\\N next\\h sp"));
}

void SubtitleProcessorTest::testParseRules_valid()
{
    ReplacementRuleList rules;
    QString error;
    QVERIFY2(ReplacementRules::parse("# names\nColour|Color\r\n\nTeh|The\nsep|a|b\nremove me|\n", &rules, &error),
             qPrintable(error));
    QCOMPARE(rules.size(), 4);
    QCOMPARE(rules[0].oldText, QString("Colour"));
    QCOMPARE(rules[0].newText, QString("Color"));
    QCOMPARE(rules[2].newText, QString("a|b"));
    QVERIFY(rules[3].newText.isEmpty());
}

void SubtitleProcessorTest::testParseRules_invalid()
{
    ReplacementRuleList rules;
    QString error;
    QVERIFY(!ReplacementRules::parse("Colour|Color\nno separator\n", &rules, &error));
    QVERIFY2(error.contains("Line 2"), qPrintable(error));
    QVERIFY(!ReplacementRules::parse("|Color\n", &rules, &error));
    QVERIFY(!ReplacementRules::parse("# only comments\n\n", &rules, &error));
    QVERIFY(!ReplacementRules::parse(QString(), &rules, &error));
}

void SubtitleProcessorTest::testLoadFromSource_localFile()
{
    const QString path = QDir(m_dir.path()).filePath("replace.txt");
    QVERIFY(writeFile(path, "Colour|Color\n"));

    QVERIFY(!ReplacementRules::isUrl(path));
    QVERIFY(ReplacementRules::isUrl("https://example.org/replace.txt"));

    ReplacementRuleList rules;
    QString error;
    QVERIFY2(ReplacementRules::loadFromSource(path, &rules, &error), qPrintable(error));
    QCOMPARE(rules.size(), 1);
    QVERIFY(!ReplacementRules::loadFromSource(path + ".missing", &rules, &error));
}

void SubtitleProcessorTest::testProcess_appliesAndReplacesMedia()
{
    FakeMuxTool mux;
    SubtitleProcessor::Options options;
    options.trackName = "Fixed";
    SubtitleProcessor processor(mux, options);

    const SubtitleResult result = processor.process(m_mediaPath, {{"Colour", "Color"}, {"colour", "color"}});

    QCOMPARE(result.outcome, SubtitleOutcome::Applied);
    QCOMPARE(result.changedLines, 1);
    QVERIFY(mux.remuxedSubtitle.contains("{\\i1}Color, color{\\i0} again"));
    QCOMPARE(mux.lastOptions.replacedTrackId, 2);
    QCOMPARE(mux.lastOptions.trackName, QString("Fixed"));
    QCOMPARE(readFile(m_mediaPath), QByteArray("original media+remuxed"));
    QCOMPARE(visibleAndHiddenFiles(), QStringList{"Show S01E01.mkv"});
}

/** @brief Test: a failing mux tool leaves the media byte-identical and reports Failed. */
void SubtitleProcessorTest::testProcess_muxFailureLeavesMediaUntouched()
{
    FakeMuxTool mux;
    mux.remuxSucceeds = false;
    SubtitleProcessor processor(mux, SubtitleProcessor::Options());

    const SubtitleResult result = processor.process(m_mediaPath, {{"Colour", "Color"}});

    QCOMPARE(result.outcome, SubtitleOutcome::Failed);
    QVERIFY(result.reason.contains("exit code 2"));
    QCOMPARE(readFile(m_mediaPath), QByteArray("original media"));
    QCOMPARE(visibleAndHiddenFiles(), QStringList{"Show S01E01.mkv"});
}

void SubtitleProcessorTest::testProcess_emptyOutputLeavesMediaUntouched()
{
    FakeMuxTool mux;
    mux.remuxWritesOutput = false;
    SubtitleProcessor processor(mux, SubtitleProcessor::Options());

    const SubtitleResult result = processor.process(m_mediaPath, {{"Colour", "Color"}});

    QCOMPARE(result.outcome, SubtitleOutcome::Failed);
    QCOMPARE(readFile(m_mediaPath), QByteArray("original media"));
}

void SubtitleProcessorTest::testProcess_noSubtitleTrack()
{
    FakeMuxTool mux;
    mux.hasTrack = false;
    SubtitleProcessor processor(mux, SubtitleProcessor::Options());

    const SubtitleResult result = processor.process(m_mediaPath, {{"Colour", "Color"}});
    QCOMPARE(result.outcome, SubtitleOutcome::Failed);
    QCOMPARE(readFile(m_mediaPath), QByteArray("original media"));
}

void SubtitleProcessorTest::testProcess_noRulesNotApplicable()
{
    FakeMuxTool mux;
    SubtitleProcessor processor(mux, SubtitleProcessor::Options());

    const SubtitleResult result = processor.process(m_mediaPath, ReplacementRuleList());
    QCOMPARE(result.outcome, SubtitleOutcome::NotApplicable);
    QVERIFY(mux.remuxedSubtitle.isEmpty());
}

void SubtitleProcessorTest::testMkvToolNix_parseIdentification()
{
    const QByteArray json = R"({"tracks":[
        {"id":0,"type":"video","properties":{"codec_id":"V_MPEG4/ISO/AVC"}},
        {"id":1,"type":"audio","properties":{"codec_id":"A_AAC","language":"jpn"}},
        {"id":2,"type":"subtitles","properties":{"codec_id":"S_HDMV/PGS","language":"eng"}},
        {"id":3,"type":"subtitles","properties":{"codec_id":"S_TEXT/ASS","language":"eng","track_name":"Full"}},
        {"id":4,"type":"subtitles","properties":{"codec_id":"S_TEXT/UTF8","language":"eng"}}
    ]})";

    SubtitleTrackInfo track;
    QString error;
    QVERIFY2(MkvToolNixMuxTool::parseIdentification(json, -1, &track, &error), qPrintable(error));
    QCOMPARE(track.id, 3);
    QCOMPARE(track.extension, QString("ass"));
    QCOMPARE(track.name, QString("Full"));

    QVERIFY(MkvToolNixMuxTool::parseIdentification(json, 4, &track, &error));
    QCOMPARE(track.extension, QString("srt"));

    QVERIFY(!MkvToolNixMuxTool::parseIdentification(json, 2, &track, &error));
    QVERIFY(!MkvToolNixMuxTool::parseIdentification(json, 9, &track, &error));
    QVERIFY(!MkvToolNixMuxTool::parseIdentification("not json", -1, &track, &error));
}

void SubtitleProcessorTest::testMkvToolNix_remuxArguments()
{
    RemuxOptions options;
    options.replacedTrackId = 3;
    options.language = "eng";
    options.trackName = "SeriesFetch Fixed";

    const QStringList args = MkvToolNixMuxTool::remuxArguments("in.mkv", "subs.ass", options, "out.mkv");
    QCOMPARE(args, QStringList({"-o", "out.mkv", "--subtitle-tracks", "!3", "in.mkv", "--language", "0:eng",
                                "--track-name", "0:SeriesFetch Fixed", "--default-track", "0:yes", "subs.ass"}));
}

QTEST_MAIN(SubtitleProcessorTest)
#include "subtitleprocessor_test.moc"

// URL allow-list, destination policy and file naming tests.
#include "test_support.hpp"

#include "linkfetch/validation.hpp"

namespace {

namespace fs = std::filesystem;

using linkfetch::ValidationError;
using linkfetch::test::TempDir;
using linkfetch::test::TestContext;

const std::vector<std::string> kHosts{"1fichier.com", "www.1fichier.com"};

template <typename Fn>
std::string rejectionOf(Fn fn) {
    try {
        fn();
    } catch (const ValidationError& ex) {
        return ex.what();
    }
    return {};
}

void test_parse_url(TestContext& t) {
    const auto parsed = linkfetch::parseUrl("HTTPS://User@WWW.1Fichier.com:443/dir/a.mkv?x=1#f");
    t.check(parsed.has_value(), "URL with credentials and port should parse");
    if (parsed) {
        t.check(parsed->scheme == "https", "scheme should be lowercased");
        t.check(parsed->host == "www.1fichier.com", "host should drop userinfo and port");
        t.check(parsed->path == "/dir/a.mkv", "path should stop at the query");
    }
    t.check(!linkfetch::parseUrl("not a url"), "text without scheme should not parse");
    t.check(!linkfetch::parseUrl("https:///path"), "URL without host should not parse");
}

void test_source_url_policy(TestContext& t) {
    t.check(rejectionOf([] { linkfetch::validateSourceUrl("https://1fichier.com/?abc", kHosts); })
                .empty(),
            "allowed https host should pass");
    t.check(rejectionOf([] {
                linkfetch::validateSourceUrl("https://WWW.1FICHIER.COM/?abc", kHosts);
            }).empty(),
            "host comparison should ignore case");

    t.checkContains(
        rejectionOf([] { linkfetch::validateSourceUrl("http://1fichier.com/?abc", kHosts); }),
        "Only HTTPS", "plain http should be rejected");
    t.checkContains(
        rejectionOf([] { linkfetch::validateSourceUrl("https://evil.example/?abc", kHosts); }),
        "Host not allowed", "foreign host should be rejected");
    t.checkContains(rejectionOf([] {
                        linkfetch::validateSourceUrl("https://1fichier.com.evil.example/", kHosts);
                    }),
                    "Host not allowed", "suffix tricks must not pass the allow-list");
    t.checkContains(
        rejectionOf([] { linkfetch::validateSourceUrl("ftp://1fichier.com/x", kHosts, false); }),
        "Unsupported URL scheme", "non-http schemes stay rejected without the https rule");
    t.checkContains(rejectionOf([] { linkfetch::validateSourceUrl("1fichier.com", kHosts); }),
                    "Malformed", "scheme-less text should be rejected");
}

void test_destination_policy(TestContext& t) {
    TempDir tmp;
    const fs::path root = tmp.path() / "downloads";
    fs::create_directories(root / "movies");
    fs::create_directories(tmp.path() / "downloads-evil");
    const std::vector<fs::path> roots{root};

    t.check(linkfetch::validateDestination(root / "movies", roots) == root / "movies",
            "folder under a root should be accepted");
    t.check(linkfetch::validateDestination(root / "new" / "sub", roots) == root / "new" / "sub",
            "not-yet-existing folder under a root should be accepted");
    t.check(linkfetch::validateDestination(root, roots) == root, "the root itself is allowed");

    t.check(!rejectionOf([&] { (void)linkfetch::validateDestination(root / ".." / "x", roots); })
                 .empty(),
            "'..' escaping the root should be rejected");
    t.check(!rejectionOf([&] {
                 (void)linkfetch::validateDestination(tmp.path() / "downloads-evil", roots);
             }).empty(),
            "sibling sharing the root's prefix should be rejected");
    t.check(!rejectionOf([&] { (void)linkfetch::validateDestination("", roots); }).empty(),
            "empty destination should be rejected");

    std::error_code ec;
    fs::create_directory_symlink(tmp.path(), root / "escape", ec);
    if (!ec) {
        t.check(!rejectionOf([&] {
                     (void)linkfetch::validateDestination(root / "escape" / "x", roots);
                 }).empty(),
                "symlink leading out of the root should be rejected");
    }
}

void test_sanitize_file_name(TestContext& t) {
    t.check(linkfetch::sanitizeFileName("Movie (2020) [1080p].mkv") == "Movie 2020 1080p.mkv",
            "brackets should be dropped, spaces kept");
    t.check(linkfetch::sanitizeFileName("../../etc/passwd") == "....etcpasswd",
            "path separators must be removed");
    t.check(linkfetch::sanitizeFileName("..") == "download.bin", "dot names fall back");
    t.check(linkfetch::sanitizeFileName("   ") == "download.bin", "blank names fall back");
    t.check(linkfetch::sanitizeFileName("") == "download.bin", "empty names fall back");
    t.check(linkfetch::sanitizeFileName("  a.mkv  ") == "a.mkv", "outer spaces are trimmed");
}

void test_file_name_from_url(TestContext& t) {
    t.check(linkfetch::fileNameFromUrl("https://cdn.example/dl/My%20Movie.mkv?token=1") ==
                "My Movie.mkv",
            "last segment should be percent-decoded without the query");
    t.check(linkfetch::fileNameFromUrl("https://1fichier.com/?abc").empty(),
            "query-only links have no file name");
    t.check(linkfetch::isGenericFileName("download"), "'download' is generic");
    t.check(linkfetch::isGenericFileName("Index.html"), "'index.html' is generic");
    t.check(!linkfetch::isGenericFileName("movie.mkv"), "real names are not generic");
}

void test_content_disposition(TestContext& t) {
    using linkfetch::fileNameFromContentDisposition;
    const auto named = [](const char* header) {
        return fileNameFromContentDisposition(header).value_or("<none>");
    };

    t.check(named("attachment; filename=\"Movie.2020.mkv\"") == "Movie.2020.mkv",
            "quoted filename");
    t.check(named("attachment; filename=Movie.mkv; size=10") == "Movie.mkv",
            "parameters after the name are ignored");
    t.check(named("attachment; filename*=UTF-8''My%20Movie.mkv") == "My Movie.mkv",
            "extended filename is percent-decoded");
    t.check(named("attachment; filename=\"fallback.mkv\"; filename*=UTF-8''Real%20Name.mkv") ==
                "Real Name.mkv",
            "extended filename wins over the plain one");
    t.check(named("ATTACHMENT; FILENAME=Upper.mkv") == "Upper.mkv",
            "parameter names are case-insensitive");
    t.check(!fileNameFromContentDisposition("inline").has_value(), "no filename parameter");
    t.check(!fileNameFromContentDisposition("attachment; filename=\"\"").has_value(),
            "empty filename is ignored");
}

void test_disambiguate(TestContext& t) {
    TempDir tmp;
    t.check(linkfetch::disambiguateFileName(tmp.path(), "movie.mkv") == "movie.mkv",
            "free name should be kept");

    linkfetch::test::writeFile(tmp.path() / "movie.mkv", "x");
    t.check(linkfetch::disambiguateFileName(tmp.path(), "movie.mkv") == "movie (1).mkv",
            "taken name should get a counter");

    linkfetch::test::writeFile(tmp.path() / "movie (1).mkv.part", "x");
    t.check(linkfetch::disambiguateFileName(tmp.path(), "movie.mkv") == "movie (2).mkv",
            "a name reserved by a part file counts as taken");
    t.check(linkfetch::partFileName("movie.mkv") == "movie.mkv.part", "part suffix");
}

} // namespace

int main() {
    TestContext t;
    test_parse_url(t);
    test_source_url_policy(t);
    test_destination_policy(t);
    test_sanitize_file_name(t);
    test_file_name_from_url(t);
    test_content_disposition(t);
    test_disambiguate(t);
    return t.finish("linkfetch_validation_tests");
}

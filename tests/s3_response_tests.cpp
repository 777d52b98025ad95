#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "s3_response.hpp"
#include "s3_storage.hpp"

namespace {

const char* kListPage = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>work</Name>
  <Prefix></Prefix>
  <KeyCount>2</KeyCount>
  <MaxKeys>1000</MaxKeys>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
  <Contents>
    <Key>upload/iblock/a&amp;b.jpg</Key>
    <LastModified>2025-01-15T03:00:00.000Z</LastModified>
    <ETag>&quot;abc&quot;</ETag>
    <Size>1536</Size>
    <StorageClass>STANDARD</StorageClass>
  </Contents>
  <Contents>
    <Key>upload/empty.txt</Key>
    <LastModified>2025-01-14T12:30:15.000Z</LastModified>
    <Size>0</Size>
  </Contents>
  <CommonPrefixes><Prefix>s3-work-file-storage/20250115_030000/</Prefix></CommonPrefixes>
</ListBucketResult>)";

} // namespace

TEST(S3ResponseTest, ParsesListObjectsPage) {
    auto page = parseListObjectsResponse(kListPage);
    ASSERT_TRUE(page.has_value()) << page.error();
    ASSERT_EQ(2u, page->objects.size());
    EXPECT_EQ("upload/iblock/a&b.jpg", page->objects[0].key);
    EXPECT_EQ(1536u, page->objects[0].size);
    EXPECT_EQ(std::chrono::system_clock::from_time_t(1736910000), page->objects[0].lastModified);
    EXPECT_EQ("upload/empty.txt", page->objects[1].key);
    EXPECT_EQ(0u, page->objects[1].size);

    ASSERT_EQ(1u, page->commonPrefixes.size());
    EXPECT_EQ("s3-work-file-storage/20250115_030000/", page->commonPrefixes[0]);
    ASSERT_TRUE(page->nextContinuationToken.has_value());
    EXPECT_EQ("1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=", *page->nextContinuationToken);
}

TEST(S3ResponseTest, LastPageHasNoToken) {
    auto page = parseListObjectsResponse(
        "<ListBucketResult><IsTruncated>false</IsTruncated><KeyCount>0</KeyCount></ListBucketResult>");
    ASSERT_TRUE(page.has_value()) << page.error();
    EXPECT_TRUE(page->objects.empty());
    EXPECT_FALSE(page->nextContinuationToken.has_value());
}

TEST(S3ResponseTest, ErrorDocumentsAreReported) {
    const char* error = "<?xml version=\"1.0\"?><Error><Code>NoSuchBucket</Code>"
                        "<Message>The specified bucket does not exist</Message></Error>";
    auto page = parseListObjectsResponse(error);
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ("NoSuchBucket: The specified bucket does not exist", page.error());
    EXPECT_EQ("HTTP 404: NoSuchBucket: The specified bucket does not exist", describeS3Error(404, error));
    EXPECT_EQ("HTTP 502", describeS3Error(502, "<html>Bad Gateway</html>"));
    EXPECT_FALSE(parseListObjectsResponse("<html></html>").has_value());
}

TEST(S3ResponseTest, InvalidSizeIsAnError) {
    auto page = parseListObjectsResponse(
        "<ListBucketResult><Contents><Key>a</Key><Size>big</Size></Contents></ListBucketResult>");
    EXPECT_FALSE(page.has_value());
}

TEST(S3ResponseTest, DeleteRequestIsQuietAndEscaped) {
    std::string body = buildDeleteRequest({"snap/a.txt", "snap/x<y>&z.txt"});
    EXPECT_NE(std::string::npos, body.find("<Delete><Quiet>true</Quiet>"));
    EXPECT_NE(std::string::npos, body.find("<Object><Key>snap/a.txt</Key></Object>"));
    EXPECT_NE(std::string::npos, body.find("<Object><Key>snap/x&lt;y&gt;&amp;z.txt</Key></Object>"));
    EXPECT_TRUE(body.ends_with("</Delete>"));
}

TEST(S3ResponseTest, DeleteErrorsListFailedKeys) {
    const char* result = R"(<DeleteResult>
        <Error><Key>snap/a.txt</Key><Code>AccessDenied</Code><Message>Access Denied</Message></Error>
        <Error><Key>snap/b&amp;c.txt</Key><Code>InternalError</Code></Error>
    </DeleteResult>)";
    std::vector<std::string> expected{"snap/a.txt", "snap/b&c.txt"};
    EXPECT_EQ(expected, parseDeleteErrors(result));
    EXPECT_TRUE(parseDeleteErrors("<DeleteResult></DeleteResult>").empty());
}

TEST(S3ResponseTest, XmlHelpers) {
    EXPECT_EQ("ListBucketResult", xmlRootElement("<?xml version=\"1.0\"?>\n<ListBucketResult xmlns=\"x\"></ListBucketResult>"));
    EXPECT_EQ("a&b<c>\"'", xmlUnescape("a&amp;b&lt;c&gt;&quot;&apos;"));
    EXPECT_EQ("&unknown;", xmlUnescape("&unknown;"));
    EXPECT_FALSE(xmlElementText("<KeyCount>2</KeyCount>", "Key").has_value());
    EXPECT_EQ("2", xmlElementText("<KeyCount>2</KeyCount>", "KeyCount").value());
    EXPECT_FALSE(parseIso8601("2025-01-15").has_value());
    EXPECT_FALSE(parseIso8601("2025-xx-15T03:00:00Z").has_value());
}

TEST(S3StorageTest, BuildsPathStyleUrls) {
    S3ObjectStorage storage(S3Endpoint{"https://s3.example.com/", "site-backups", "AK", "SK", ""});
    EXPECT_EQ("site-backups", storage.bucket());
    EXPECT_EQ("https://s3.example.com/site-backups/backups/sitevault_backup_20250115_030000.tar.gz",
              storage.objectUrl("backups/sitevault_backup_20250115_030000.tar.gz"));
    EXPECT_EQ("https://s3.example.com/site-backups/snap/a%20b%2Bc.txt", storage.objectUrl("snap/a b+c.txt"));
    EXPECT_EQ("https://s3.example.com/site-backups?list-type=2", storage.listUrl("", "", std::nullopt));
    EXPECT_EQ("https://s3.example.com/site-backups?continuation-token=a%2Fb%3D&delimiter=%2F&list-type=2&prefix=backups%2Fsitevault_backup_",
              storage.listUrl("backups/sitevault_backup_", "/", std::string("a/b=")));
}

TEST(S3StorageTest, UriEncodeKeepsUnreservedCharacters) {
    EXPECT_EQ("AZaz09-_.~", S3ObjectStorage::uriEncode("AZaz09-_.~", false));
    EXPECT_EQ("a/b", S3ObjectStorage::uriEncode("a/b", true));
    EXPECT_EQ("a%2Fb", S3ObjectStorage::uriEncode("a/b", false));
    EXPECT_EQ("%D1%84", S3ObjectStorage::uriEncode("\xD1\x84", true));
}

TEST(S3ResponseTest, NumericCharacterReferencesAreDecoded) {
    EXPECT_EQ("line\rbreak", xmlUnescape("line&#13;break"));
    EXPECT_EQ("line\rbreak", xmlUnescape("line&#x0D;break"));
    EXPECT_EQ("tab\there", xmlUnescape("tab&#X9;here"));
    EXPECT_EQ("\xD1\x84", xmlUnescape("&#x444;"));
    EXPECT_EQ("&#;", xmlUnescape("&#;"));
    EXPECT_EQ("&#xZZ;", xmlUnescape("&#xZZ;"));
    EXPECT_EQ("&#13", xmlUnescape("&#13"));
}

TEST(S3ResponseTest, ListedKeysWithControlCharactersAreDecoded) {
    auto page = parseListObjectsResponse(
        "<ListBucketResult><Contents><Key>upload/odd&#13;name.txt</Key><Size>4</Size></Contents>"
        "<IsTruncated>false</IsTruncated></ListBucketResult>");
    ASSERT_TRUE(page.has_value()) << page.error();
    ASSERT_EQ(1u, page->objects.size());
    EXPECT_EQ("upload/odd\rname.txt", page->objects[0].key);
}

TEST(S3ResponseTest, ParsesInitiateMultipartUpload) {
    auto uploadId = parseInitiateMultipartUpload(R"(<?xml version="1.0" encoding="UTF-8"?>
<InitiateMultipartUploadResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Bucket>site-backups</Bucket>
  <Key>backups/sitevault_backup_20250115_030000.tar.gz</Key>
  <UploadId>VXBsb2FkIElE&amp;x</UploadId>
</InitiateMultipartUploadResult>)");
    ASSERT_TRUE(uploadId.has_value()) << uploadId.error();
    EXPECT_EQ("VXBsb2FkIElE&x", *uploadId);

    EXPECT_FALSE(parseInitiateMultipartUpload("<InitiateMultipartUploadResult></InitiateMultipartUploadResult>").has_value());
    auto denied = parseInitiateMultipartUpload("<Error><Code>AccessDenied</Code><Message>Access Denied</Message></Error>");
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ("AccessDenied: Access Denied", denied.error());
}

TEST(S3ResponseTest, CompleteMultipartUploadListsPartsInOrder) {
    std::string body = buildCompleteMultipartUpload({{1, "\"etag-1\""}, {2, "\"etag-2\""}});
    EXPECT_NE(std::string::npos, body.find("<CompleteMultipartUpload><Part><PartNumber>1</PartNumber>"
                                           "<ETag>&quot;etag-1&quot;</ETag></Part><Part><PartNumber>2</PartNumber>"
                                           "<ETag>&quot;etag-2&quot;</ETag></Part></CompleteMultipartUpload>"));
}

TEST(S3StorageTest, BuildsMultipartPartUrls) {
    S3ObjectStorage storage(S3Endpoint{"https://s3.example.com", "site-backups", "AK", "SK", ""});
    EXPECT_EQ("https://s3.example.com/site-backups/backups/a.tar.gz?partNumber=3&uploadId=abc%2Bdef%3D",
              storage.partUrl("backups/a.tar.gz", "abc+def=", 3));
}

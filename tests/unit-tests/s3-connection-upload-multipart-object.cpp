#include "s3.connection.hh"
#include "s3.test.credentials.hh"
#include "unit.test.macros.hh"

int
main()
{
    std::string s3_endpoint, bucket_name, s3_access_key_id,
      s3_secret_access_key;
    if (!get_credentials(
          s3_endpoint, bucket_name, s3_access_key_id, s3_secret_access_key)) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;
    const std::string object_name = "test-multipart-object";

    try {
        objupload::S3Connection conn(
          s3_endpoint, s3_access_key_id, s3_secret_access_key);

        if (!conn.check_connection()) {
            LOG_ERROR("Failed to connect to S3.");
            return 1;
        }
        CHECK(conn.bucket_exists(bucket_name));
        CHECK(conn.delete_object(bucket_name, object_name));
        CHECK(!conn.object_exists(bucket_name, object_name));

        // an aborted upload leaves no object behind
        {
            std::string upload_id =
              conn.create_multipart_object(bucket_name, object_name);
            CHECK(!upload_id.empty());

            std::vector<uint8_t> data(5 << 20, 1);
            std::string etag = conn.upload_multipart_object_part(
              bucket_name, object_name, upload_id, data, 1, {});
            CHECK(!etag.empty());

            CHECK(
              conn.abort_multipart_object(bucket_name, object_name, upload_id));
            CHECK(!conn.object_exists(bucket_name, object_name));
        }

        std::string upload_id =
          conn.create_multipart_object(bucket_name, object_name);
        CHECK(!upload_id.empty());

        std::list<minio::s3::Part> parts;

        // parts need to be at least 5MiB, except the last part
        std::vector<uint8_t> data(5 << 20, 0);
        uint64_t last_progress = 0;
        for (auto i = 0; i < 4; ++i) {
            std::string etag = conn.upload_multipart_object_part(
              bucket_name,
              object_name,
              upload_id,
              data,
              i + 1,
              [&last_progress](uint64_t nbytes) { last_progress = nbytes; });
            CHECK(!etag.empty());

            minio::s3::Part part;
            part.number = i + 1;
            part.etag = etag;
            part.size = data.size();

            parts.push_back(part);
        }

        // last part is 1MiB
        {
            const unsigned int part_number = parts.size() + 1;
            const size_t part_size = 1 << 20; // 1MiB
            std::string etag = conn.upload_multipart_object_part(
              bucket_name,
              object_name,
              upload_id,
              std::span<const uint8_t>(data.data(), part_size),
              part_number,
              {});
            CHECK(!etag.empty());

            minio::s3::Part part;
            part.number = part_number;
            part.etag = etag;
            part.size = part_size;

            parts.push_back(part);
        }

        CHECK(conn.complete_multipart_object(
          bucket_name, object_name, upload_id, parts));

        CHECK(conn.object_exists(bucket_name, object_name));

        // cleanup
        CHECK(conn.delete_object(bucket_name, object_name));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed: ", e.what());
    }

    return retval;
}

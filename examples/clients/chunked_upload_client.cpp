/**
 * Chunked Upload Client Example
 *
 * This example demonstrates how to:
 * 1. Split a local file into fixed-size chunks
 * 2. Ask the server which chunks of an upload it already holds
 * 3. Submit the missing chunks as multipart/form-data
 * 4. Detect when the server has reassembled the file
 *
 * Usage: chunkyard_upload_client <server_url> <file> [chunk_bytes] [upload_id]
 * Pass the upload_id printed by an interrupted run to resume it.
 */

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/StringPartSource.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>
#include <Poco/UUIDGenerator.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

class ChunkedUploadClient {
private:
    HTTPClientSession session;

public:
    explicit ChunkedUploadClient(const string& url) {
        Poco::URI uri(url);
        session.setHost(uri.getHost());
        session.setPort(uri.getPort());
    }

    /**
     * Parts the server already staged for upload_id (empty for a new upload)
     */
    set<int> receivedParts(const string& upload_id) {
        set<int> parts;
        HTTPRequest request(HTTPRequest::HTTP_GET, "/v1/uploads/" + upload_id,
                            HTTPMessage::HTTP_1_1);
        session.sendRequest(request);

        HTTPResponse response;
        istream& response_stream = session.receiveResponse(response);
        stringstream body;
        Poco::StreamCopier::copyStream(response_stream, body);
        if (response.getStatus() != HTTPResponse::HTTP_OK) {
            return parts;
        }

        Parser parser;
        Object::Ptr status = parser.parse(body.str()).extract<Object::Ptr>();
        Array::Ptr staged = status->getArray("parts");
        for (size_t i = 0; staged && i < staged->size(); ++i) {
            parts.insert(staged->getElement<int>(i));
        }
        return parts;
    }

    /**
     * Submit one chunk; returns the parsed {ok, error?, finished?} response
     */
    Object::Ptr submitChunk(const string& upload_id, Poco::UInt64 upload_size, int part,
                            int total, const string& data, const string& file_name) {
        Object::Ptr info = new Object;
        info->set("uploadId", upload_id);
        info->set("uploadSize", upload_size);
        info->set("part", part);
        info->set("total", total);
        stringstream info_json;
        info->stringify(info_json);

        HTMLForm form(HTMLForm::ENCODING_MULTIPART);
        form.set("bigFileUpload", "true");
        form.set("info", info_json.str());
        form.addPart("file", new StringPartSource(data, "application/octet-stream", file_name));

        HTTPRequest request(HTTPRequest::HTTP_POST, "/v1/uploads/chunks", HTTPMessage::HTTP_1_1);
        form.prepareSubmit(request);
        ostream& request_stream = session.sendRequest(request);
        form.write(request_stream);

        HTTPResponse response;
        istream& response_stream = session.receiveResponse(response);
        stringstream body;
        Poco::StreamCopier::copyStream(response_stream, body);

        Parser parser;
        return parser.parse(body.str()).extract<Object::Ptr>();
    }

    /**
     * Upload local_path in chunks; the final chunk is always sent last
     */
    bool uploadFile(const string& local_path, size_t chunk_bytes, const string& upload_id) {
        ifstream file(local_path, ios::binary);
        if (!file.is_open()) {
            cout << "Cannot open file: " << local_path << endl;
            return false;
        }
        const string content((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());
        if (content.empty()) {
            cout << "Refusing to upload an empty file" << endl;
            return false;
        }
        const int total = static_cast<int>((content.size() + chunk_bytes - 1) / chunk_bytes);
        const string file_name = Poco::Path(local_path).getFileName();

        const auto already = receivedParts(upload_id);
        cout << "Upload " << upload_id << ": " << total << " parts, " << already.size()
             << " already on server" << endl;

        for (int part = 1; part <= total; ++part) {
            if (part != total && already.count(part) > 0) {
                continue;
            }
            const size_t offset = static_cast<size_t>(part - 1) * chunk_bytes;
            const string data = content.substr(offset, min(chunk_bytes, content.size() - offset));
            Object::Ptr result = submitChunk(upload_id, content.size(), part, total, data,
                                             file_name);
            if (!result->getValue<bool>("ok")) {
                cout << "Part " << part << " rejected: " << result->getValue<string>("error")
                     << endl;
                return false;
            }
            if (result->has("finished") && result->getValue<bool>("finished")) {
                cout << "Upload finished" << endl;
                return true;
            }
            cout << "Part " << part << "/" << total << " stored" << endl;
        }
        cout << "Server did not report completion" << endl;
        return false;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        cout << "usage: " << argv[0] << " <server_url> <file> [chunk_bytes] [upload_id]" << endl;
        return 2;
    }
    const string server_url = argv[1];
    const string file_path = argv[2];
    const size_t chunk_bytes = argc > 3 ? static_cast<size_t>(stoull(argv[3])) : 1024 * 1024;
    const string upload_id =
        argc > 4 ? argv[4] : Poco::UUIDGenerator().createRandom().toString();
    if (chunk_bytes == 0) {
        cout << "chunk_bytes must be positive" << endl;
        return 2;
    }

    try {
        ChunkedUploadClient client(server_url);
        return client.uploadFile(file_path, chunk_bytes, upload_id) ? 0 : 1;
    } catch (const exception& e) {
        cout << "Upload error: " << e.what() << endl;
        return 1;
    }
}

#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QNetworkProxy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <memory>

#include "client/http_transport.hpp"

namespace {

// Single-route HTTP/1.1 server living on the test thread. The transport's
// local event loop drives it while a request is pending.
class MiniHttpServer : public QObject
{
public:
    int statusCode = 200;
    QByteArray reasonPhrase = "OK";
    QByteArray body;
    bool respond = true;
    QByteArray lastRequestHead;

    MiniHttpServer()
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket *socket = m_server.nextPendingConnection()) {
                socket->setParent(this);
                auto buffer = std::make_shared<QByteArray>();
                QObject::connect(socket, &QTcpSocket::readyRead, this, [this, socket, buffer]() {
                    buffer->append(socket->readAll());
                    const int headEnd = buffer->indexOf("\r\n\r\n");
                    if (headEnd < 0) {
                        return;
                    }
                    lastRequestHead = buffer->left(headEnd);
                    if (!respond) {
                        return;
                    }
                    QByteArray reply = "HTTP/1.1 " + QByteArray::number(statusCode) + ' '
                        + reasonPhrase + "\r\n";
                    reply += "Content-Type: application/json\r\n";
                    reply += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
                    reply += "Connection: close\r\n\r\n";
                    reply += body;
                    socket->write(reply);
                    socket->disconnectFromHost();
                });
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost, 0); }

    QUrl url(const QString &path) const
    {
        return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(m_server.serverPort()).arg(path));
    }

private:
    QTcpServer m_server;
};

} // namespace

class HttpTransportTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testSuccessWithBasicAuth();
    void testServerErrorIsNotOk();
    void testTimeout();
    void testConnectionRefused();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void HttpTransportTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    QNetworkProxy::setApplicationProxy(QNetworkProxy(QNetworkProxy::NoProxy));
}

void HttpTransportTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void HttpTransportTests::testSuccessWithBasicAuth()
{
    MiniHttpServer server;
    QVERIFY(server.listen());
    server.body = R"({"ctl": 50, "atl": 30})";

    intervals::HttpRequest request;
    request.url = server.url(QStringLiteral("/api/v1/athlete/i42/wellness/2024-03-09"));
    request.username = QStringLiteral("API_KEY");
    request.password = QStringLiteral("secret");
    request.timeoutMs = 5000;

    intervals::QtHttpTransport transport;
    const intervals::HttpResponse response = transport.get(request);

    QVERIFY2(response.ok, qPrintable(response.errorString));
    QCOMPARE(response.statusCode, 200);
    QCOMPARE(response.body, server.body);

    QVERIFY(server.lastRequestHead.startsWith(
        "GET /api/v1/athlete/i42/wellness/2024-03-09 HTTP/1.1"));
    const QByteArray expectedAuth = "Authorization: Basic " + QByteArray("API_KEY:secret").toBase64();
    QVERIFY2(server.lastRequestHead.contains(expectedAuth), server.lastRequestHead.constData());
    QVERIFY(server.lastRequestHead.contains("Accept: application/json"));
}

void HttpTransportTests::testServerErrorIsNotOk()
{
    MiniHttpServer server;
    QVERIFY(server.listen());
    server.statusCode = 500;
    server.reasonPhrase = "Internal Server Error";
    server.body = R"({"error": "boom"})";

    intervals::HttpRequest request;
    request.url = server.url(QStringLiteral("/wellness"));
    request.timeoutMs = 5000;

    intervals::QtHttpTransport transport;
    const intervals::HttpResponse response = transport.get(request);

    QVERIFY(!response.ok);
    QCOMPARE(response.statusCode, 500);
    QVERIFY(!response.errorString.isEmpty());
}

void HttpTransportTests::testTimeout()
{
    MiniHttpServer server;
    QVERIFY(server.listen());
    server.respond = false;

    intervals::HttpRequest request;
    request.url = server.url(QStringLiteral("/events"));
    request.timeoutMs = 300;

    QElapsedTimer elapsed;
    elapsed.start();
    intervals::QtHttpTransport transport;
    const intervals::HttpResponse response = transport.get(request);

    QVERIFY(!response.ok);
    QCOMPARE(response.statusCode, 0);
    QVERIFY(elapsed.elapsed() < 5000);
}

void HttpTransportTests::testConnectionRefused()
{
    quint16 closedPort = 0;
    {
        QTcpServer reserved;
        QVERIFY(reserved.listen(QHostAddress::LocalHost, 0));
        closedPort = reserved.serverPort();
    }

    intervals::HttpRequest request;
    request.url = QUrl(QStringLiteral("http://127.0.0.1:%1/wellness").arg(closedPort));
    request.timeoutMs = 2000;

    intervals::QtHttpTransport transport;
    const intervals::HttpResponse response = transport.get(request);

    QVERIFY(!response.ok);
    QCOMPARE(response.statusCode, 0);
    QVERIFY(!response.errorString.isEmpty());
}

QTEST_MAIN(HttpTransportTests)
#include "test_http_transport.moc"

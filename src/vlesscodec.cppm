/*!
 * @file        vlesscodec.cppm
 * @brief       VLESS request/response header codec.
 *
 * @details
 * Encodes the client request header (version, UUID, addons, command,
 * port, address), parses the server response header, negotiates the flow
 * mode once per session, and passes payload through unchanged.
 *
 * Request layout:
 * | version (1) | uuid (16) | addons len (1) | addons | command (1) | port (2, BE) | atyp (1) | address |
 *
 * Response layout:
 * | version (1) | addons len (1) | addons |
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QString>
#include <QtTypes>

#include <optional>

export module vlesstunnel.core.vlesscodec;
import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;

/**
 * @struct ProtocolError
 * @brief Fatal protocol failure for one session.
 */
export struct ProtocolError {
    enum class Kind
    {
        BadResponseHeader,   //!< Response header truncated or malformed.
        UnsupportedVersion,  //!< Version byte does not match.
        InvalidRequest       //!< Request header cannot be encoded or decoded.
    };

    Kind kind = Kind::BadResponseHeader;  //!< Failure category.
    QString message;                      //!< Human-readable detail.

    /**
     * @brief Category and detail in one line.
     * @return Formatted text.
     */
    QString describe() const;
};

//! Request command byte.
export enum class VlessCommand : quint8
{
    Tcp = 0x01,
    Udp = 0x02,
    Mux = 0x03
};

//! Address type byte.
export enum class AddressType : quint8
{
    IPv4 = 0x01,
    Domain = 0x02,
    IPv6 = 0x03
};

/**
 * @struct RequestHeader
 * @brief Decoded request header.
 */
export struct RequestHeader {
    quint8 version = 0;                        //!< Protocol version.
    Credential credential;                     //!< User UUID.
    QByteArray addons;                         //!< Raw addons bytes.
    VlessCommand command = VlessCommand::Tcp;  //!< Requested command.
    quint16 port = 0;                          //!< Destination port.
    AddressType addressType = AddressType::Domain; //!< Destination address type.
    QString address;                           //!< Destination address text.
};

/**
 * @struct ResponseHeader
 * @brief Decoded response header.
 */
export struct ResponseHeader {
    quint8 version = 0;  //!< Echoed protocol version.
    QByteArray addons;   //!< Raw addons bytes, ignored by the client.
};

/**
 * @class VlessCodec
 * @brief Stateful codec for one session.
 */
export class VlessCodec
{
public:
    //! Protocol version sent and expected.
    static constexpr quint8 kVersion = 0x00;
    //! Maximum length of a domain address.
    static constexpr int kMaxDomainLength = 255;

    //! Outcome of incremental header parsing.
    enum class ParseStatus
    {
        Complete,      //!< Header consumed from the buffer.
        NeedMoreData,  //!< Buffer holds a prefix of a header.
        Failed         //!< Header is invalid.
    };

    /**
     * @brief Construct codec for a flow mode.
     * @param flow Flow requested by the profile.
     */
    explicit VlessCodec(FlowControl flow = FlowControl::None);

    /**
     * @brief Requested flow mode.
     * @return Flow value.
     */
    FlowControl flow() const;

    /**
     * @brief Encode the request header for a TCP destination.
     * @param credential User UUID.
     * @param address Destination host name or IP literal.
     * @param port Destination port.
     * @param error Optional output error on failure.
     * @return Header bytes or empty optional.
     */
    std::optional<QByteArray> encodeRequest(const Credential& credential, const QString& address, quint16 port,
                                            ProtocolError *error = nullptr) const;

    /**
     * @brief Decode a request header from the front of a buffer.
     * @param buffer Received bytes.
     * @param header Output header on success.
     * @param consumed Output header length on success.
     * @param error Optional output error on failure.
     * @return Parse outcome.
     */
    static ParseStatus decodeRequest(const QByteArray& buffer, RequestHeader *header, qsizetype *consumed,
                                     ProtocolError *error = nullptr);

    /**
     * @brief Encode a response header.
     * @param header Header values.
     * @return Header bytes.
     */
    static QByteArray encodeResponse(const ResponseHeader& header);

    /**
     * @brief Parse the response header from the front of `buffer`.
     * @param buffer Received bytes; the header is removed on success and
     *        any following payload bytes stay in place.
     * @param header Optional output header on success.
     * @param error Optional output error on failure.
     * @return Parse outcome.
     */
    ParseStatus parseResponse(QByteArray& buffer, ResponseHeader *header = nullptr, ProtocolError *error = nullptr);

    /**
     * @brief Finalize flow negotiation after the response header.
     * @return Negotiated flow mode.
     *
     * @details Called once per session before payload forwarding; later
     * calls return the same value.
     */
    FlowControl negotiateFlow();

    /**
     * @brief Whether `negotiateFlow()` has run.
     * @return True after negotiation.
     */
    bool isFlowNegotiated() const;

    /**
     * @brief Addons bytes carrying a flow mode.
     * @param flow Flow value.
     * @return Protobuf-encoded addons, empty for `FlowControl::None`.
     */
    static QByteArray flowAddons(FlowControl flow);

    /**
     * @brief Prepare outbound payload.
     * @param payload Application bytes.
     * @return Bytes to write to the transport.
     */
    QByteArray encodePayload(const QByteArray& payload) const;

    /**
     * @brief Recover inbound payload.
     * @param data Bytes read from the transport.
     * @return Application bytes.
     */
    QByteArray decodePayload(const QByteArray& data) const;

private:
    static void setError(ProtocolError *error, ProtocolError::Kind kind, const QString& message);

    FlowControl m_flow;              //!< Requested flow.
    bool m_flowNegotiated = false;   //!< Set by negotiateFlow().
    bool m_responseParsed = false;   //!< Set once the response header completes.
};

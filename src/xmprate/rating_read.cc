#include "xmprate/rating_read.h"

namespace xmprate {
namespace {

    static RatingReadResult finish_read(const PacketScanResult& scan,
                                        const std::vector<std::byte>& packet,
                                        const RatingReadOptions& options) noexcept
    {
        RatingReadResult r;
        r.scan = scan;

        if (scan.status == PacketScanStatus::NotFound) {
            r.status = RatingReadStatus::NotFound;
            return r;
        }
        if (scan.status != PacketScanStatus::Found) {
            r.status = RatingReadStatus::IoError;
            return r;
        }

        r.extract = extract_rating(packet, options.extract);
        if (r.extract.status != RatingStatus::Ok) {
            r.status = RatingReadStatus::Malformed;
            return r;
        }
        r.status = RatingReadStatus::Ok;
        r.rating = r.extract.rating;
        return r;
    }

}  // namespace

RatingReadResult
read_rating(const char* path, const RatingReadOptions& options,
            std::vector<std::byte>* packet_out) noexcept
{
    std::vector<std::byte> scratch;
    std::vector<std::byte>* packet = packet_out ? packet_out : &scratch;

    const PacketScanResult scan = locate_packet(path, options.scan, packet);
    return finish_read(scan, *packet, options);
}


RatingReadResult
read_rating(StreamFile& file, const RatingReadOptions& options,
            std::vector<std::byte>* packet_out) noexcept
{
    std::vector<std::byte> scratch;
    std::vector<std::byte>* packet = packet_out ? packet_out : &scratch;

    const PacketScanResult scan = locate_packet(file, options.scan, packet);
    return finish_read(scan, *packet, options);
}

}  // namespace xmprate

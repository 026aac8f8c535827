#pragma once

#include "backtest/accuracy_report.hpp"
#include "backtest/prediction.hpp"
#include "backtest/session.hpp"
#include "signals/signal_engine.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// prediction_parquet — one row per prediction across a universe
//
// Columns: ticker, timestamp, direction, confidence, bull_score, bear_score,
// entry_price, session, then change_<label> / correct_<label> /
// dir_move_<label> per horizon, then mfe, mae.
// ---------------------------------------------------------------------------
namespace prediction_parquet {

inline std::shared_ptr<arrow::Schema> schema(const std::vector<std::string>& labels) {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("ticker", arrow::utf8()));
    fields.push_back(arrow::field("timestamp", arrow::int64()));
    fields.push_back(arrow::field("direction", arrow::int8()));
    fields.push_back(arrow::field("confidence", arrow::float64()));
    fields.push_back(arrow::field("bull_score", arrow::float64()));
    fields.push_back(arrow::field("bear_score", arrow::float64()));
    fields.push_back(arrow::field("entry_price", arrow::float64()));
    fields.push_back(arrow::field("session", arrow::utf8()));
    for (const auto& label : labels) {
        fields.push_back(arrow::field("change_" + label, arrow::float64()));
        fields.push_back(arrow::field("correct_" + label, arrow::boolean()));
        fields.push_back(arrow::field("dir_move_" + label, arrow::float64()));
    }
    fields.push_back(arrow::field("mfe", arrow::float64()));
    fields.push_back(arrow::field("mae", arrow::float64()));
    return arrow::schema(fields);
}

// Horizon labels are taken from the first report; every report must share
// the same horizon configuration.
inline arrow::Result<std::shared_ptr<arrow::Table>> build_table(
        const std::vector<AccuracyReport>& reports) {
    std::vector<std::string> labels;
    for (const auto& r : reports) {
        if (r.horizons.empty()) continue;
        for (const auto& h : r.horizons) labels.push_back(h.label);
        break;
    }
    size_t nh = labels.size();

    arrow::StringBuilder ticker_b, session_b;
    arrow::Int64Builder ts_b;
    arrow::Int8Builder dir_b;
    arrow::DoubleBuilder conf_b, bull_b, bear_b, entry_b, mfe_b, mae_b;
    std::vector<arrow::DoubleBuilder> change_b(nh), dir_move_b(nh);
    std::vector<arrow::BooleanBuilder> correct_b(nh);

    for (const auto& r : reports) {
        if (r.horizons.size() != nh && !r.raw_predictions.empty()) {
            return arrow::Status::Invalid("ticker ", r.ticker,
                                          " has a different horizon count");
        }
        for (const auto& p : r.raw_predictions) {
            ARROW_RETURN_NOT_OK(ticker_b.Append(r.ticker));
            ARROW_RETURN_NOT_OK(ts_b.Append(static_cast<int64_t>(p.timestamp)));
            ARROW_RETURN_NOT_OK(dir_b.Append(static_cast<int8_t>(p.direction)));
            ARROW_RETURN_NOT_OK(conf_b.Append(p.confidence));
            ARROW_RETURN_NOT_OK(bull_b.Append(p.bull_score));
            ARROW_RETURN_NOT_OK(bear_b.Append(p.bear_score));
            ARROW_RETURN_NOT_OK(entry_b.Append(p.entry_price));
            ARROW_RETURN_NOT_OK(session_b.Append(session::name(p.session)));
            for (size_t h = 0; h < nh; ++h) {
                if (h < p.outcomes.size()) {
                    ARROW_RETURN_NOT_OK(change_b[h].Append(p.outcomes[h].change_pct));
                    ARROW_RETURN_NOT_OK(correct_b[h].Append(p.outcomes[h].correct));
                    ARROW_RETURN_NOT_OK(dir_move_b[h].Append(p.outcomes[h].dir_move));
                } else {
                    ARROW_RETURN_NOT_OK(change_b[h].AppendNull());
                    ARROW_RETURN_NOT_OK(correct_b[h].AppendNull());
                    ARROW_RETURN_NOT_OK(dir_move_b[h].AppendNull());
                }
            }
            ARROW_RETURN_NOT_OK(mfe_b.Append(p.excursion.mfe));
            ARROW_RETURN_NOT_OK(mae_b.Append(p.excursion.mae));
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    auto finish = [&](arrow::ArrayBuilder& b) -> arrow::Status {
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
        return arrow::Status::OK();
    };

    ARROW_RETURN_NOT_OK(finish(ticker_b));
    ARROW_RETURN_NOT_OK(finish(ts_b));
    ARROW_RETURN_NOT_OK(finish(dir_b));
    ARROW_RETURN_NOT_OK(finish(conf_b));
    ARROW_RETURN_NOT_OK(finish(bull_b));
    ARROW_RETURN_NOT_OK(finish(bear_b));
    ARROW_RETURN_NOT_OK(finish(entry_b));
    ARROW_RETURN_NOT_OK(finish(session_b));
    for (size_t h = 0; h < nh; ++h) {
        ARROW_RETURN_NOT_OK(finish(change_b[h]));
        ARROW_RETURN_NOT_OK(finish(correct_b[h]));
        ARROW_RETURN_NOT_OK(finish(dir_move_b[h]));
    }
    ARROW_RETURN_NOT_OK(finish(mfe_b));
    ARROW_RETURN_NOT_OK(finish(mae_b));

    return arrow::Table::Make(schema(labels), arrays);
}

// Write every report's predictions to `path` with ZSTD compression.
inline arrow::Status write(const std::string& path, const std::vector<AccuracyReport>& reports) {
    ARROW_ASSIGN_OR_RAISE(auto table, build_table(reports));
    ARROW_ASSIGN_OR_RAISE(auto outfile, arrow::io::FileOutputStream::Open(path));

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk_size = std::max<int64_t>(1, table->num_rows());
    ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile, chunk_size, props));
    return outfile->Close();
}

}  // namespace prediction_parquet
